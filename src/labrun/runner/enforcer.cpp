#include "labrun/runner/enforcer.hpp"

#include "labrun/util/log.hpp"

namespace labrun {

TimeoutEnforcer::TimeoutEnforcer(const RunConfig& config, IEngine& engine)
    : config_(config), engine_(engine) {}

auto TimeoutEnforcer::enforce(const Instance& instance) -> Result<void> {
  log::info("Stopping timed-out container {} ({})",
            instance.container_id.short_id(), instance.source_path.string());
  if (auto r = engine_.stop(instance.container_id, config_.stop_grace); !r) {
    log::error("Failed to stop container {}", instance.container_id);
    return r;
  }
  return ok();
}

auto TimeoutEnforcer::enforce_all(std::span<const Instance> timed_out)
    -> Result<void> {
  for (const auto& instance : timed_out) {
    if (auto r = enforce(instance); !r) {
      return r;
    }
  }
  return ok();
}

}  // namespace labrun
