#include "labrun/runner/poller.hpp"

#include "labrun/util/log.hpp"

namespace labrun {

auto classify(const Instance& instance, ContainerStatus status, TimePoint now,
              std::chrono::seconds timeout) noexcept -> Classification {
  if (status == ContainerStatus::Unknown) {
    return Classification::Unknown;
  }
  if (status != ContainerStatus::Running) {
    return Classification::Finished;
  }
  if (now - instance.start_time >= timeout) {
    return Classification::TimedOut;
  }
  return Classification::StillRunning;
}

StatusPoller::StatusPoller(const RunConfig& config, IEngine& engine,
                           IClock& clock)
    : config_(config), engine_(engine), clock_(clock) {}

auto StatusPoller::poll(std::vector<Instance> running) -> Result<PollPartition> {
  PollPartition partition;
  partition.running.reserve(running.size());

  for (auto& instance : running) {
    auto state = engine_.inspect(instance.container_id);
    if (!state) {
      log::error("Failed to inspect container {}", instance.container_id);
      return fail(state.error());
    }

    auto verdict =
        classify(instance, state->status, clock_.now(), config_.timeout);
    log::trace("container {} status={} -> {}", instance.container_id.short_id(),
               state->raw_status, to_string_view(verdict));

    switch (verdict) {
      case Classification::StillRunning:
        partition.running.push_back(std::move(instance));
        break;
      case Classification::TimedOut:
        log::info("Container {} exceeded {}s timeout",
                  instance.container_id.short_id(), config_.timeout.count());
        partition.timed_out.push_back(std::move(instance));
        break;
      case Classification::Finished:
        if (!is_terminal(state->status)) {
          log::warn("Container {} is {}, not exited; collecting its result "
                    "may block until it exits",
                    instance.container_id.short_id(), state->raw_status);
        } else {
          log::info("Container {} finished (status {})",
                    instance.container_id.short_id(), state->raw_status);
        }
        partition.finished.push_back(std::move(instance));
        break;
      case Classification::Unknown:
        log::error("Container {} reported unrecognised status '{}'",
                   instance.container_id, state->raw_status);
        return fail(Error::UnknownContainerStatus);
    }
  }

  return ok(std::move(partition));
}

}  // namespace labrun
