#pragma once

#include "labrun/core/constants.hpp"
#include "labrun/core/error.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace labrun {

struct IsolationConfig {
  bool enabled{true};
  std::string network{isolation::kDefaultNetwork};
};

// Immutable once the run starts; every component takes it by const reference.
struct RunConfig {
  std::string engine{"docker"};
  std::string image{"labwork-runner:latest"};
  std::string endpoint{"http://localhost:8080"};
  std::string client_id;
  std::string assignment_id;
  std::chrono::seconds timeout{timing::kDefaultTimeout};
  std::chrono::milliseconds poll_interval{timing::kDefaultPollInterval};
  // Unset means the engine's own default grace period.
  std::optional<std::chrono::seconds> stop_grace;
  IsolationConfig isolation;
  bool remove_containers{false};
  std::string log_level{"warn"};
};

[[nodiscard]] auto validate(const RunConfig& config) -> Result<void>;

}  // namespace labrun
