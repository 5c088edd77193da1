#pragma once

#include "labrun/config/run_config.hpp"
#include "labrun/core/error.hpp"
#include "labrun/engine/engine.hpp"
#include "labrun/runner/instance.hpp"

#include <span>

namespace labrun {

// Stops timed-out containers so that a later wait() has an exit code to
// return.
class TimeoutEnforcer {
public:
  TimeoutEnforcer(const RunConfig& config, IEngine& engine);

  [[nodiscard]] auto enforce(const Instance& instance) -> Result<void>;
  [[nodiscard]] auto enforce_all(std::span<const Instance> timed_out)
      -> Result<void>;

private:
  const RunConfig& config_;
  IEngine& engine_;
};

}  // namespace labrun
