#pragma once

#include "labrun/config/run_config.hpp"
#include "labrun/core/error.hpp"
#include "labrun/engine/engine.hpp"
#include "labrun/runner/collector.hpp"
#include "labrun/runner/enforcer.hpp"
#include "labrun/runner/instance.hpp"
#include "labrun/runner/launcher.hpp"
#include "labrun/runner/poller.hpp"
#include "labrun/util/clock.hpp"

#include <cstddef>
#include <filesystem>
#include <span>
#include <vector>

namespace labrun {

// Launch -> poll until nothing runs -> stop the timed-out -> collect.
// Single-threaded; every engine call blocks. A failed engine call aborts the
// run and leaves already-created containers behind.
class Orchestrator {
public:
  Orchestrator(const RunConfig& config, IEngine& engine, IClock& clock);

  [[nodiscard]] auto run(std::span<const std::filesystem::path> artifacts)
      -> Result<std::vector<FinishedInstance>>;

  [[nodiscard]] auto launch_all(std::span<const std::filesystem::path> artifacts)
      -> Result<std::vector<Instance>>;

  // Timed-out results come first, then naturally exited ones.
  [[nodiscard]] auto supervise(std::vector<Instance> running)
      -> Result<std::vector<FinishedInstance>>;

  [[nodiscard]] auto poll_iterations() const noexcept -> std::size_t {
    return poll_iterations_;
  }

private:
  const RunConfig& config_;
  IClock& clock_;
  InstanceLauncher launcher_;
  StatusPoller poller_;
  TimeoutEnforcer enforcer_;
  ResultCollector collector_;
  std::size_t poll_iterations_{0};
};

}  // namespace labrun
