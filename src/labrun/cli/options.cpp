#include "labrun/cli/options.hpp"

#include "labrun/config/config.hpp"
#include "labrun/util/log.hpp"

#include <charconv>
#include <print>

namespace labrun::cli {

namespace {

auto parse_long(std::string_view text) -> std::optional<long> {
  long value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

auto parse_args(std::span<const std::string_view> args) -> Result<Options> {
  Options opts;
  auto& ov = opts.overrides;
  bool positional_only = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view arg = args[i];

    if (positional_only || arg.empty() || arg.front() != '-' || arg == "-") {
      opts.artifacts.emplace_back(std::string(arg));
      continue;
    }

    auto value = [&](std::string_view flag) -> std::optional<std::string_view> {
      if (i + 1 >= args.size()) {
        std::println(stderr, "Error: {} requires an argument", flag);
        return std::nullopt;
      }
      return args[++i];
    };

    auto number = [&](std::string_view flag) -> std::optional<long> {
      auto text = value(flag);
      if (!text) {
        return std::nullopt;
      }
      auto n = parse_long(*text);
      if (!n || *n < 0) {
        std::println(stderr, "Error: {} expects a non-negative integer, got '{}'",
                     flag, *text);
        return std::nullopt;
      }
      return n;
    };

    if (arg == "--") {
      positional_only = true;
    } else if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
    } else if (arg == "--version") {
      opts.show_version = true;
    } else if (arg == "-v" || arg == "--verbose") {
      ++ov.verbosity;
    } else if (arg.starts_with("-v") &&
               arg.find_first_not_of('v', 1) == std::string_view::npos) {
      ov.verbosity += static_cast<int>(arg.size() - 1);
    } else if (arg == "--no-isolation") {
      ov.no_isolation = true;
    } else if (arg == "--remove") {
      ov.remove_containers = true;
    } else if (arg == "-c" || arg == "--config") {
      auto v = value(arg);
      if (!v) return fail(Error::InvalidArgument);
      opts.config_file = std::string(*v);
    } else if (arg == "--endpoint") {
      auto v = value(arg);
      if (!v) return fail(Error::InvalidArgument);
      ov.endpoint = std::string(*v);
    } else if (arg == "--client-id") {
      auto v = value(arg);
      if (!v) return fail(Error::InvalidArgument);
      ov.client_id = std::string(*v);
    } else if (arg == "--assignment-id") {
      auto v = value(arg);
      if (!v) return fail(Error::InvalidArgument);
      ov.assignment_id = std::string(*v);
    } else if (arg == "--engine") {
      auto v = value(arg);
      if (!v) return fail(Error::InvalidArgument);
      ov.engine = std::string(*v);
    } else if (arg == "--image") {
      auto v = value(arg);
      if (!v) return fail(Error::InvalidArgument);
      ov.image = std::string(*v);
    } else if (arg == "--log-level") {
      auto v = value(arg);
      if (!v) return fail(Error::InvalidArgument);
      if (!log::parse_level(*v)) {
        std::println(stderr, "Error: unknown log level '{}'", *v);
        return fail(Error::InvalidArgument);
      }
      ov.log_level = std::string(*v);
    } else if (arg == "--timeout") {
      auto n = number(arg);
      if (!n) return fail(Error::InvalidArgument);
      ov.timeout = std::chrono::seconds(*n);
    } else if (arg == "--poll-interval") {
      auto n = number(arg);
      if (!n) return fail(Error::InvalidArgument);
      ov.poll_interval = std::chrono::milliseconds(*n);
    } else if (arg == "--stop-grace") {
      auto n = number(arg);
      if (!n) return fail(Error::InvalidArgument);
      ov.stop_grace = std::chrono::seconds(*n);
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      return fail(Error::InvalidArgument);
    }
  }

  return ok(std::move(opts));
}

auto apply_overrides(RunConfig config, const Overrides& overrides)
    -> RunConfig {
  if (overrides.engine) config.engine = *overrides.engine;
  if (overrides.image) config.image = *overrides.image;
  if (overrides.endpoint) config.endpoint = *overrides.endpoint;
  if (overrides.client_id) config.client_id = *overrides.client_id;
  if (overrides.assignment_id) config.assignment_id = *overrides.assignment_id;
  if (overrides.timeout) config.timeout = *overrides.timeout;
  if (overrides.poll_interval) config.poll_interval = *overrides.poll_interval;
  if (overrides.stop_grace) config.stop_grace = overrides.stop_grace;
  if (overrides.no_isolation) config.isolation.enabled = false;
  if (overrides.remove_containers) config.remove_containers = true;

  if (overrides.log_level) {
    config.log_level = *overrides.log_level;
  } else if (overrides.verbosity > 0) {
    config.log_level =
        std::string(log::level_name(log::level_from_verbosity(overrides.verbosity)));
  }
  return config;
}

auto resolve_config(const Options& options) -> Result<RunConfig> {
  RunConfig base;
  if (!options.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(options.config_file);
    if (!loaded) {
      return fail(loaded.error());
    }
    base = std::move(*loaded);
  }

  auto config = apply_overrides(std::move(base), options.overrides);
  if (auto r = validate(config); !r) {
    return fail(r.error());
  }
  return ok(std::move(config));
}

auto print_usage(std::FILE* out, std::string_view prog) -> void {
  std::println(out, "labrun - run labwork submissions in isolated containers");
  std::println(out, "Usage: {} [OPTIONS] <submission.tar.gz>...", prog);
  std::println(out, "");
  std::println(out, "Options:");
  std::println(out, "  --client-id <id>        Client identifier (required)");
  std::println(out, "  --assignment-id <id>    Assignment identifier (required)");
  std::println(out,
               "  --endpoint <uri>        Test server URI (default: "
               "http://localhost:8080)");
  std::println(out, "  --engine <path>         Container engine CLI (default: docker)");
  std::println(out,
               "  --image <ref>           Runner image (default: "
               "labwork-runner:latest)");
  std::println(out, "  --timeout <sec>         Per-submission timeout (default: 300)");
  std::println(out, "  --poll-interval <ms>    Status poll interval (default: 3000)");
  std::println(out,
               "  --stop-grace <sec>      Grace period when stopping "
               "(default: engine default)");
  std::println(out, "  --no-isolation          Give containers network access");
  std::println(out, "  --remove                Remove containers after collecting logs");
  std::println(out, "  -c, --config <file>     YAML config file");
  std::println(out, "  -v, --verbose           More logging (repeatable)");
  std::println(out, "  --log-level <level>     trace|debug|info|warn|error");
  std::println(out, "  --version               Show version and exit");
  std::println(out, "  -h, --help              Show this help message");
  std::println(out, "");
  std::println(out,
               "Containers are not stopped if labrun itself is killed; clean "
               "them up with the engine CLI.");
}

auto print_version(std::FILE* out) -> void {
  std::println(out, "labrun v0.1.0");
}

}  // namespace labrun::cli
