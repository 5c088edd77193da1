#include "labrun/runner/launcher.hpp"

#include "labrun/core/constants.hpp"
#include "labrun/util/log.hpp"

#include <system_error>

namespace labrun {

auto check_artifact(const std::filesystem::path& artifact) -> Result<void> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(artifact, ec)) {
    log::warn("Skipping {}: not a regular file", artifact.string());
    return fail(Error::InvalidArtifact);
  }
  if (!artifact.filename().string().ends_with(submission::kArchiveSuffix)) {
    log::warn("Skipping {}: expected a {} archive", artifact.string(),
              submission::kArchiveSuffix);
    return fail(Error::InvalidArtifact);
  }
  return ok();
}

auto build_create_request(const RunConfig& config) -> CreateRequest {
  CreateRequest request{
      .image = config.image,
      .command = std::string(submission::kRunnerCommand),
      .args = {config.endpoint, config.client_id, config.assignment_id},
      .network = std::nullopt,
  };

  if (config.isolation.enabled) {
    request.network = NetworkOptions{
        .network = config.isolation.network,
        .dns = {std::string(isolation::kNullDns)},
        .dns_search = {std::string(isolation::kNoSearchDomain)},
    };
  }
  return request;
}

InstanceLauncher::InstanceLauncher(const RunConfig& config, IEngine& engine,
                                   IClock& clock)
    : config_(config), engine_(engine), clock_(clock) {}

auto InstanceLauncher::prepare_network() -> Result<void> {
  if (!config_.isolation.enabled || network_ready_) {
    return ok();
  }
  if (auto r = engine_.ensure_network(config_.isolation.network); !r) {
    return r;
  }
  network_ready_ = true;
  return ok();
}

auto InstanceLauncher::launch(const std::filesystem::path& artifact)
    -> Result<std::optional<Instance>> {
  if (!check_artifact(artifact)) {
    return std::optional<Instance>{};
  }

  if (!config_.isolation.enabled) {
    log::warn("Network isolation disabled; {} can reach the network",
              artifact.string());
  }
  if (auto r = prepare_network(); !r) {
    return fail(r.error());
  }

  auto id = engine_.create(build_create_request(config_));
  if (!id) {
    log::error("Failed to create container for {}", artifact.string());
    return fail(id.error());
  }

  if (auto r = engine_.copy_in(*id, artifact, submission::kContainerPath); !r) {
    log::error("Failed to copy {} into container {}", artifact.string(), *id);
    return fail(r.error());
  }

  if (auto r = engine_.start(*id); !r) {
    log::error("Failed to start container {}", *id);
    return fail(r.error());
  }

  auto start_time = clock_.now();
  log::info("Started container {} for {}", id->short_id(), artifact.string());
  return std::optional<Instance>{
      Instance{artifact, std::move(*id), start_time}};
}

}  // namespace labrun
