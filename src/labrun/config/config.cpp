#include "labrun/config/config.hpp"

#include "labrun/config/yaml_utils.hpp"
#include "labrun/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<labrun::IsolationConfig> {
  static bool decode(const Node& node, labrun::IsolationConfig& i) {
    if (!node.IsMap()) {
      return false;
    }
    i.enabled = labrun::yaml_get_or(node, "enabled", true);
    i.network = labrun::yaml_get_or<std::string>(
        node, "network", std::string(labrun::isolation::kDefaultNetwork));
    return true;
  }
};

template <>
struct convert<labrun::RunConfig> {
  static bool decode(const Node& node, labrun::RunConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    c.engine = labrun::yaml_get_or<std::string>(node, "engine", c.engine);
    c.image = labrun::yaml_get_or<std::string>(node, "image", c.image);
    c.endpoint = labrun::yaml_get_or<std::string>(node, "endpoint", c.endpoint);
    c.client_id = labrun::yaml_get_or<std::string>(node, "client_id", "");
    c.assignment_id =
        labrun::yaml_get_or<std::string>(node, "assignment_id", "");
    c.timeout = std::chrono::seconds(
        labrun::yaml_get_or<long>(node, "timeout_sec", c.timeout.count()));
    c.poll_interval = std::chrono::milliseconds(labrun::yaml_get_or<long>(
        node, "poll_interval_ms", c.poll_interval.count()));
    if (auto grace = node["stop_grace_sec"]; grace && grace.IsScalar()) {
      c.stop_grace = std::chrono::seconds(grace.as<long>());
    }
    if (auto isolation = node["isolation"]) {
      c.isolation = isolation.as<labrun::IsolationConfig>();
    }
    c.remove_containers = labrun::yaml_get_or(node, "remove_containers", false);
    c.log_level = labrun::yaml_get_or<std::string>(node, "log_level", "warn");
    return true;
  }
};

}  // namespace YAML

namespace labrun {

auto validate(const RunConfig& config) -> Result<void> {
  if (config.engine.empty()) {
    log::error("Engine executable must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (config.image.empty()) {
    log::error("Image reference must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (config.client_id.empty()) {
    log::error("Client id is required");
    return fail(Error::InvalidArgument);
  }
  if (config.assignment_id.empty()) {
    log::error("Assignment id is required");
    return fail(Error::InvalidArgument);
  }
  if (config.timeout.count() <= 0) {
    log::error("Timeout must be positive, got {}s", config.timeout.count());
    return fail(Error::InvalidArgument);
  }
  if (config.poll_interval.count() <= 0) {
    log::error("Poll interval must be positive, got {}ms",
               config.poll_interval.count());
    return fail(Error::InvalidArgument);
  }
  if (config.timeout > timing::kMaxDuration) {
    log::error("Timeout of {}s is too large, limit is {}s",
               config.timeout.count(), timing::kMaxDuration.count());
    return fail(Error::InvalidArgument);
  }
  if (config.poll_interval > timing::kMaxDuration) {
    log::error("Poll interval of {}ms is too large, limit is {}s",
               config.poll_interval.count(), timing::kMaxDuration.count());
    return fail(Error::InvalidArgument);
  }
  if (config.stop_grace && config.stop_grace->count() < 0) {
    log::error("Stop grace period must not be negative");
    return fail(Error::InvalidArgument);
  }
  if (config.stop_grace && *config.stop_grace > timing::kMaxDuration) {
    log::error("Stop grace period of {}s is too large, limit is {}s",
               config.stop_grace->count(), timing::kMaxDuration.count());
    return fail(Error::InvalidArgument);
  }
  if (!log::parse_level(config.log_level)) {
    log::error("Unknown log level '{}'", config.log_level);
    return fail(Error::InvalidArgument);
  }
  if (config.isolation.enabled && config.isolation.network.empty()) {
    log::error("Isolation network name must not be empty");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path) -> Result<RunConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<RunConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    if (!root.IsMap()) {
      log::error("Failed to parse YAML: top level must be a mapping");
      return fail(Error::ParseError);
    }
    RunConfig config = root.as<RunConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace labrun
