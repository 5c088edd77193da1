#include "labrun/runner/orchestrator.hpp"

#include "labrun/util/log.hpp"

#include <unordered_set>

namespace labrun {

Orchestrator::Orchestrator(const RunConfig& config, IEngine& engine,
                           IClock& clock)
    : config_(config),
      clock_(clock),
      launcher_(config, engine, clock),
      poller_(config, engine, clock),
      enforcer_(config, engine),
      collector_(config, engine) {}

auto Orchestrator::launch_all(std::span<const std::filesystem::path> artifacts)
    -> Result<std::vector<Instance>> {
  std::vector<Instance> launched;
  launched.reserve(artifacts.size());
  std::unordered_set<ContainerId> seen;

  for (const auto& artifact : artifacts) {
    auto instance = launcher_.launch(artifact);
    if (!instance) {
      return fail(instance.error());
    }
    if (!instance->has_value()) {
      continue;
    }
    if (!seen.insert((*instance)->container_id).second) {
      log::error("Engine handed out container id {} twice",
                 (*instance)->container_id);
      return fail(Error::DuplicateContainerId);
    }
    launched.push_back(std::move(**instance));
  }

  return ok(std::move(launched));
}

auto Orchestrator::supervise(std::vector<Instance> running)
    -> Result<std::vector<FinishedInstance>> {
  std::vector<Instance> timed_out;
  std::vector<Instance> exited;
  const auto total = running.size();

  while (!running.empty()) {
    ++poll_iterations_;
    auto partition = poller_.poll(std::move(running));
    if (!partition) {
      return fail(partition.error());
    }

    if (auto r = enforcer_.enforce_all(partition->timed_out); !r) {
      return fail(r.error());
    }

    for (auto& instance : partition->timed_out) {
      timed_out.push_back(std::move(instance));
    }
    for (auto& instance : partition->finished) {
      exited.push_back(std::move(instance));
    }
    running = std::move(partition->running);

    if (!running.empty()) {
      log::debug("{} container(s) still running, next poll in {}ms",
                 running.size(), config_.poll_interval.count());
      clock_.sleep_for(config_.poll_interval);
    }
  }

  std::vector<FinishedInstance> results;
  results.reserve(total);

  for (auto& instance : timed_out) {
    auto finished = collector_.collect(std::move(instance), ExitReason::TimedOut);
    if (!finished) {
      return fail(finished.error());
    }
    results.push_back(std::move(*finished));
  }
  for (auto& instance : exited) {
    auto finished = collector_.collect(std::move(instance), ExitReason::Exited);
    if (!finished) {
      return fail(finished.error());
    }
    results.push_back(std::move(*finished));
  }

  return ok(std::move(results));
}

auto Orchestrator::run(std::span<const std::filesystem::path> artifacts)
    -> Result<std::vector<FinishedInstance>> {
  auto launched = launch_all(artifacts);
  if (!launched) {
    return fail(launched.error());
  }
  if (launched->empty()) {
    log::warn("No submission could be launched");
    return std::vector<FinishedInstance>{};
  }

  log::info("Supervising {} container(s), timeout {}s",
            launched->size(), config_.timeout.count());
  return supervise(std::move(*launched));
}

}  // namespace labrun
