#pragma once

#include "labrun/config/run_config.hpp"
#include "labrun/core/error.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace labrun::cli {

// Flags given on the command line; unset fields keep the config file value.
struct Overrides {
  std::optional<std::string> engine;
  std::optional<std::string> image;
  std::optional<std::string> endpoint;
  std::optional<std::string> client_id;
  std::optional<std::string> assignment_id;
  std::optional<std::string> log_level;
  std::optional<std::chrono::seconds> timeout;
  std::optional<std::chrono::milliseconds> poll_interval;
  std::optional<std::chrono::seconds> stop_grace;
  bool no_isolation{false};
  bool remove_containers{false};
  int verbosity{0};
};

struct Options {
  std::string config_file;
  Overrides overrides;
  std::vector<std::filesystem::path> artifacts;
  bool show_help{false};
  bool show_version{false};
};

// `args` excludes the program name.
[[nodiscard]] auto parse_args(std::span<const std::string_view> args)
    -> Result<Options>;

[[nodiscard]] auto apply_overrides(RunConfig config, const Overrides& overrides)
    -> RunConfig;

// Config file (if any) with command-line overrides applied, validated.
[[nodiscard]] auto resolve_config(const Options& options) -> Result<RunConfig>;

auto print_usage(std::FILE* out, std::string_view prog) -> void;
auto print_version(std::FILE* out) -> void;

}  // namespace labrun::cli
