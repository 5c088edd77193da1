#include "labrun/engine/cli_engine.hpp"

#include "labrun/util/log.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <charconv>
#include <format>

namespace labrun {

using json = nlohmann::json;

namespace {

constexpr int kExecFailedExitCode = 127;
constexpr const char* kMasqueradeKey =
    "com.docker.network.bridge.enable_ip_masquerade";
constexpr std::string_view kMasqueradeOption =
    "com.docker.network.bridge.enable_ip_masquerade=false";

auto trim(std::string_view s) -> std::string_view {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

auto last_line(std::string_view s) -> std::string_view {
  s = trim(s);
  if (auto pos = s.rfind('\n'); pos != std::string_view::npos) {
    return trim(s.substr(pos + 1));
  }
  return s;
}

}  // namespace

auto is_valid_container_id(std::string_view id) -> bool {
  if (id.empty() || id.size() > 64) {
    return false;
  }
  for (char c : id) {
    if (!std::isalnum(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

auto build_create_args(const CreateRequest& request)
    -> std::vector<std::string> {
  std::vector<std::string> args{"create"};
  if (request.network) {
    args.push_back("--network");
    args.push_back(request.network->network);
    for (const auto& dns : request.network->dns) {
      args.push_back("--dns");
      args.push_back(dns);
    }
    for (const auto& search : request.network->dns_search) {
      args.push_back("--dns-search");
      args.push_back(search);
    }
  }
  args.push_back(request.image);
  if (!request.command.empty()) {
    args.push_back(request.command);
  }
  args.insert(args.end(), request.args.begin(), request.args.end());
  return args;
}

auto parse_inspect_output(std::string_view json_text)
    -> Result<ContainerState> {
  try {
    auto root = json::parse(json_text.begin(), json_text.end());
    // `inspect` prints an array even for a single container
    const json* entry = &root;
    if (root.is_array()) {
      if (root.size() != 1) {
        log::error("Expected one inspect entry, got {}", root.size());
        return fail(Error::ParseError);
      }
      entry = &root.front();
    }
    if (!entry->is_object() || !entry->contains("State") ||
        !(*entry)["State"].is_object()) {
      log::error("Inspect output has no State object");
      return fail(Error::ParseError);
    }
    const auto& state = (*entry)["State"];
    if (!state.contains("Status") || !state["Status"].is_string()) {
      log::error("Inspect output has no State.Status string");
      return fail(Error::ParseError);
    }

    ContainerState result;
    result.raw_status = state["Status"].get<std::string>();
    result.status = parse_container_status(result.raw_status);
    return ok(std::move(result));
  } catch (const json::exception& e) {
    log::error("Failed to parse inspect output: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto check_network_isolation(std::string_view json_text) -> Result<void> {
  try {
    auto root = json::parse(json_text.begin(), json_text.end());
    const json* entry = &root;
    if (root.is_array()) {
      if (root.size() != 1) {
        log::error("Expected one network inspect entry, got {}", root.size());
        return fail(Error::ParseError);
      }
      entry = &root.front();
    }
    if (!entry->is_object()) {
      log::error("Network inspect output is not an object");
      return fail(Error::ParseError);
    }

    auto name = entry->value("Name", std::string{});
    if (!entry->value("Internal", false)) {
      log::error("Network {} is not internal; containers on it can reach "
                 "the outside", name);
      return fail(Error::NetworkNotIsolated);
    }
    if (entry->contains("Options") && (*entry)["Options"].is_object()) {
      const auto& options = (*entry)["Options"];
      if (options.contains(kMasqueradeKey) &&
          options[kMasqueradeKey] == "true") {
        log::error("Network {} has IP masquerading enabled", name);
        return fail(Error::NetworkNotIsolated);
      }
    }
    return ok();
  } catch (const json::exception& e) {
    log::error("Failed to parse network inspect output: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto parse_wait_output(std::string_view text) -> Result<int> {
  auto line = last_line(text);
  int code = 0;
  auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), code);
  if (line.empty() || ec != std::errc{} || ptr != line.data() + line.size()) {
    log::error("Unexpected wait output: '{}'", line);
    return fail(Error::ParseError);
  }
  return code;
}

struct CliEngine::Impl {
  std::string executable;

  auto run(std::vector<std::string> args, ProcessOptions options = {})
      -> Result<ProcessResult> {
    args.insert(args.begin(), executable);
    log::debug("engine: {}", describe(args));

    auto result = run_process(args, options);
    if (!result) {
      return fail(result.error());
    }
    return result;
  }

  // Same as run() but a non-zero exit is an engine failure.
  auto run_checked(std::vector<std::string> args, ProcessOptions options = {})
      -> Result<ProcessResult> {
    auto subcommand = args.empty() ? std::string{} : args.front();
    auto result = run(std::move(args), options);
    if (!result) {
      return result;
    }
    if (result->exit_code == kExecFailedExitCode) {
      log::error("Could not execute container engine '{}'", executable);
      return fail(Error::EngineCommandFailed);
    }
    if (result->exit_code != 0) {
      const auto& diag = options.merge_stderr ? result->stdout_output
                                              : result->stderr_output;
      log::error("{} {} failed with exit code {}: {}", executable, subcommand,
                 result->exit_code, trim(diag));
      return fail(Error::EngineCommandFailed);
    }
    return result;
  }

  static auto describe(const std::vector<std::string>& args) -> std::string {
    std::string out;
    for (const auto& a : args) {
      if (!out.empty()) {
        out += ' ';
      }
      out += a;
    }
    return out;
  }
};

CliEngine::CliEngine(std::string executable)
    : impl_(std::make_unique<Impl>(Impl{std::move(executable)})) {}

CliEngine::~CliEngine() = default;

CliEngine::CliEngine(CliEngine&&) noexcept = default;
auto CliEngine::operator=(CliEngine&&) noexcept -> CliEngine& = default;

auto CliEngine::executable() const noexcept -> const std::string& {
  return impl_->executable;
}

auto CliEngine::ensure_network(std::string_view name) -> Result<void> {
  auto probe = impl_->run({"network", "inspect", std::string(name)});
  if (!probe) {
    return fail(probe.error());
  }
  if (probe->exit_code == 0) {
    log::debug("Isolation network {} already exists", name);
    return check_network_isolation(probe->stdout_output);
  }

  log::info("Creating isolation network {}", name);
  auto created = impl_->run_checked({"network", "create", "--driver", "bridge",
                                     "--internal", "--opt",
                                     std::string(kMasqueradeOption),
                                     std::string(name)});
  if (!created) {
    return fail(created.error());
  }
  return ok();
}

auto CliEngine::create(const CreateRequest& request) -> Result<ContainerId> {
  auto result = impl_->run_checked(build_create_args(request));
  if (!result) {
    return fail(result.error());
  }

  auto id = last_line(result->stdout_output);
  if (!is_valid_container_id(id)) {
    log::error("Engine returned invalid container id: '{}'", id);
    return fail(Error::InvalidContainerId);
  }
  return ContainerId{std::string(id)};
}

auto CliEngine::copy_in(const ContainerId& id,
                        const std::filesystem::path& host_path,
                        std::string_view container_path) -> Result<void> {
  auto result = impl_->run_checked(
      {"cp", host_path.string(), std::format("{}:{}", id, container_path)});
  if (!result) {
    return fail(result.error());
  }
  return ok();
}

auto CliEngine::start(const ContainerId& id) -> Result<void> {
  auto result = impl_->run_checked({"start", id.str()});
  if (!result) {
    return fail(result.error());
  }
  return ok();
}

auto CliEngine::inspect(const ContainerId& id) -> Result<ContainerState> {
  auto result =
      impl_->run_checked({"inspect", "--type", "container", id.str()});
  if (!result) {
    return fail(result.error());
  }
  return parse_inspect_output(result->stdout_output);
}

auto CliEngine::stop(const ContainerId& id,
                     std::optional<std::chrono::seconds> grace)
    -> Result<void> {
  std::vector<std::string> args{"stop"};
  if (grace) {
    args.push_back("--time");
    args.push_back(std::to_string(grace->count()));
  }
  args.push_back(id.str());

  auto result = impl_->run_checked(std::move(args));
  if (!result) {
    return fail(result.error());
  }
  return ok();
}

auto CliEngine::wait(const ContainerId& id) -> Result<int> {
  auto result = impl_->run_checked({"wait", id.str()});
  if (!result) {
    return fail(result.error());
  }
  return parse_wait_output(result->stdout_output);
}

auto CliEngine::logs(const ContainerId& id) -> Result<std::string> {
  auto result =
      impl_->run_checked({"logs", id.str()}, ProcessOptions{.merge_stderr = true});
  if (!result) {
    return fail(result.error());
  }
  return std::move(result->stdout_output);
}

auto CliEngine::remove(const ContainerId& id) -> Result<void> {
  auto result = impl_->run_checked({"rm", id.str()});
  if (!result) {
    return fail(result.error());
  }
  return ok();
}

}  // namespace labrun
