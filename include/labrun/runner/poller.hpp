#pragma once

#include "labrun/config/run_config.hpp"
#include "labrun/core/error.hpp"
#include "labrun/engine/engine.hpp"
#include "labrun/runner/instance.hpp"
#include "labrun/util/clock.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

namespace labrun {

enum class Classification : std::uint8_t {
  StillRunning,
  TimedOut,
  Finished,
  Unknown,
};

[[nodiscard]] constexpr auto to_string_view(Classification c) noexcept
    -> std::string_view {
  switch (c) {
    case Classification::StillRunning:
      return "still running";
    case Classification::TimedOut:
      return "timed out";
    case Classification::Finished:
      return "finished";
    case Classification::Unknown:
      return "unknown";
  }
  return "unknown";
}

// Pure: depends only on its arguments.
[[nodiscard]] auto classify(const Instance& instance, ContainerStatus status,
                            TimePoint now, std::chrono::seconds timeout) noexcept
    -> Classification;

struct PollPartition {
  std::vector<Instance> running;
  std::vector<Instance> timed_out;
  std::vector<Instance> finished;
};

class StatusPoller {
public:
  StatusPoller(const RunConfig& config, IEngine& engine, IClock& clock);

  // Inspects every instance once and hands each back in exactly one bucket.
  // Fails on engine errors and on statuses the engine reports that we do not
  // recognise.
  [[nodiscard]] auto poll(std::vector<Instance> running) -> Result<PollPartition>;

private:
  const RunConfig& config_;
  IEngine& engine_;
  IClock& clock_;
};

}  // namespace labrun
