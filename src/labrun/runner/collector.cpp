#include "labrun/runner/collector.hpp"

#include "labrun/util/log.hpp"

namespace labrun {

ResultCollector::ResultCollector(const RunConfig& config, IEngine& engine)
    : config_(config), engine_(engine) {}

auto ResultCollector::collect(Instance instance, ExitReason reason)
    -> Result<FinishedInstance> {
  auto code = engine_.wait(instance.container_id);
  if (!code) {
    log::error("Failed to wait for container {}", instance.container_id);
    return fail(code.error());
  }

  auto output = engine_.logs(instance.container_id);
  if (!output) {
    log::error("Failed to fetch logs of container {}", instance.container_id);
    return fail(output.error());
  }

  if (config_.remove_containers) {
    if (auto r = engine_.remove(instance.container_id); !r) {
      log::error("Failed to remove container {}", instance.container_id);
      return fail(r.error());
    }
    log::debug("Removed container {}", instance.container_id.short_id());
  }

  log::info("Collected container {}: {} with code {} ({} bytes of output)",
            instance.container_id.short_id(), to_string_view(reason), *code,
            output->size());

  return FinishedInstance{
      .instance = std::move(instance),
      .exit_reason = reason,
      .return_code = *code,
      .log = std::move(*output),
  };
}

}  // namespace labrun
