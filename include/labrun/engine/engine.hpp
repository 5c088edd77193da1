#pragma once

#include "labrun/core/error.hpp"
#include "labrun/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labrun {

enum class ContainerStatus : std::uint8_t {
  Created,
  Running,
  Paused,
  Restarting,
  Removing,
  Exited,
  Dead,
  Unknown,
};

[[nodiscard]] constexpr auto to_string_view(ContainerStatus status) noexcept
    -> std::string_view {
  switch (status) {
    case ContainerStatus::Created:
      return "created";
    case ContainerStatus::Running:
      return "running";
    case ContainerStatus::Paused:
      return "paused";
    case ContainerStatus::Restarting:
      return "restarting";
    case ContainerStatus::Removing:
      return "removing";
    case ContainerStatus::Exited:
      return "exited";
    case ContainerStatus::Dead:
      return "dead";
    case ContainerStatus::Unknown:
      return "unknown";
  }
  return "unknown";
}

// Engine state strings are matched exactly; anything else is Unknown.
[[nodiscard]] constexpr auto parse_container_status(std::string_view s) noexcept
    -> ContainerStatus {
  if (s == "created") return ContainerStatus::Created;
  if (s == "running") return ContainerStatus::Running;
  if (s == "paused") return ContainerStatus::Paused;
  if (s == "restarting") return ContainerStatus::Restarting;
  if (s == "removing") return ContainerStatus::Removing;
  if (s == "exited") return ContainerStatus::Exited;
  if (s == "dead") return ContainerStatus::Dead;
  return ContainerStatus::Unknown;
}

// States after which `wait` returns without the container being stopped.
[[nodiscard]] constexpr auto is_terminal(ContainerStatus status) noexcept
    -> bool {
  return status == ContainerStatus::Exited || status == ContainerStatus::Dead ||
         status == ContainerStatus::Removing;
}

struct NetworkOptions {
  std::string network;
  std::vector<std::string> dns;
  std::vector<std::string> dns_search;
};

struct CreateRequest {
  std::string image;
  std::string command;
  std::vector<std::string> args;
  std::optional<NetworkOptions> network;
};

struct ContainerState {
  ContainerStatus status{ContainerStatus::Unknown};
  std::string raw_status;
};

// Synchronous container engine. Every call blocks until the engine answers.
class IEngine {
public:
  virtual ~IEngine() = default;

  // Creates the sandbox network if it does not exist yet: internal bridge,
  // no IP masquerading.
  virtual auto ensure_network(std::string_view name) -> Result<void> = 0;

  virtual auto create(const CreateRequest& request) -> Result<ContainerId> = 0;

  virtual auto copy_in(const ContainerId& id,
                       const std::filesystem::path& host_path,
                       std::string_view container_path) -> Result<void> = 0;

  virtual auto start(const ContainerId& id) -> Result<void> = 0;

  virtual auto inspect(const ContainerId& id) -> Result<ContainerState> = 0;

  // nullopt grace uses the engine default.
  virtual auto stop(const ContainerId& id,
                    std::optional<std::chrono::seconds> grace)
      -> Result<void> = 0;

  virtual auto wait(const ContainerId& id) -> Result<int> = 0;

  // Combined stdout and stderr, byte for byte.
  virtual auto logs(const ContainerId& id) -> Result<std::string> = 0;

  virtual auto remove(const ContainerId& id) -> Result<void> = 0;
};

}  // namespace labrun
