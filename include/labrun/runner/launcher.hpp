#pragma once

#include "labrun/config/run_config.hpp"
#include "labrun/core/error.hpp"
#include "labrun/engine/engine.hpp"
#include "labrun/runner/instance.hpp"
#include "labrun/util/clock.hpp"

#include <filesystem>
#include <optional>

namespace labrun {

// Regular file whose name ends in the archive suffix.
[[nodiscard]] auto check_artifact(const std::filesystem::path& artifact)
    -> Result<void>;

[[nodiscard]] auto build_create_request(const RunConfig& config)
    -> CreateRequest;

class InstanceLauncher {
public:
  InstanceLauncher(const RunConfig& config, IEngine& engine, IClock& clock);

  // nullopt when the artifact is rejected; an error when the engine fails.
  [[nodiscard]] auto launch(const std::filesystem::path& artifact)
      -> Result<std::optional<Instance>>;

private:
  auto prepare_network() -> Result<void>;

  const RunConfig& config_;
  IEngine& engine_;
  IClock& clock_;
  bool network_ready_{false};
};

}  // namespace labrun
