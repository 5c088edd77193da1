#pragma once

#include "labrun/engine/engine.hpp"
#include "labrun/engine/process.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace labrun {

// Drives a docker-compatible engine CLI (docker, podman) as child processes.
class CliEngine : public IEngine {
public:
  explicit CliEngine(std::string executable);
  ~CliEngine() override;

  CliEngine(const CliEngine&) = delete;
  auto operator=(const CliEngine&) -> CliEngine& = delete;
  CliEngine(CliEngine&&) noexcept;
  auto operator=(CliEngine&&) noexcept -> CliEngine&;

  auto ensure_network(std::string_view name) -> Result<void> override;
  auto create(const CreateRequest& request) -> Result<ContainerId> override;
  auto copy_in(const ContainerId& id, const std::filesystem::path& host_path,
               std::string_view container_path) -> Result<void> override;
  auto start(const ContainerId& id) -> Result<void> override;
  auto inspect(const ContainerId& id) -> Result<ContainerState> override;
  auto stop(const ContainerId& id, std::optional<std::chrono::seconds> grace)
      -> Result<void> override;
  auto wait(const ContainerId& id) -> Result<int> override;
  auto logs(const ContainerId& id) -> Result<std::string> override;
  auto remove(const ContainerId& id) -> Result<void> override;

  [[nodiscard]] auto executable() const noexcept -> const std::string&;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

[[nodiscard]] auto is_valid_container_id(std::string_view id) -> bool;

// `create` argument vector, without the executable itself.
[[nodiscard]] auto build_create_args(const CreateRequest& request)
    -> std::vector<std::string>;

// Parses `inspect --type container` JSON output.
[[nodiscard]] auto parse_inspect_output(std::string_view json_text)
    -> Result<ContainerState>;

// Accepts `network inspect` output only for an internal network without IP
// masquerading.
[[nodiscard]] auto check_network_isolation(std::string_view json_text)
    -> Result<void>;

[[nodiscard]] auto parse_wait_output(std::string_view text) -> Result<int>;

}  // namespace labrun
