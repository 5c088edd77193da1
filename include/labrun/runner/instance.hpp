#pragma once

#include "labrun/util/clock.hpp"
#include "labrun/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace labrun {

// One container execution of one submission. Move-only so that exactly one
// owner exists at any point of the run.
struct Instance {
  std::filesystem::path source_path;
  ContainerId container_id;
  TimePoint start_time;

  Instance() = default;
  Instance(std::filesystem::path source, ContainerId id, TimePoint start)
      : source_path(std::move(source)),
        container_id(std::move(id)),
        start_time(start) {}

  Instance(const Instance&) = delete;
  auto operator=(const Instance&) -> Instance& = delete;
  Instance(Instance&&) noexcept = default;
  auto operator=(Instance&&) noexcept -> Instance& = default;
};

enum class ExitReason : std::uint8_t {
  Exited,
  TimedOut,
};

[[nodiscard]] constexpr auto to_string_view(ExitReason reason) noexcept
    -> std::string_view {
  switch (reason) {
    case ExitReason::Exited:
      return "exited";
    case ExitReason::TimedOut:
      return "timed out";
  }
  return "unknown";
}

struct FinishedInstance {
  Instance instance;
  ExitReason exit_reason{ExitReason::Exited};
  int return_code{0};
  std::string log;
};

}  // namespace labrun
