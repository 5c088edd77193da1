#include "labrun/cli/options.hpp"
#include "labrun/engine/cli_engine.hpp"
#include "labrun/runner/orchestrator.hpp"
#include "labrun/runner/presenter.hpp"
#include "labrun/util/clock.hpp"
#include "labrun/util/log.hpp"

#include <cstdio>
#include <print>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRunFailed = 1;
constexpr int kExitUsage = 2;

auto run(const labrun::RunConfig& config,
         const std::vector<std::filesystem::path>& artifacts) -> int {
  labrun::CliEngine engine(config.engine);
  labrun::SteadyClock clock;
  labrun::Orchestrator orchestrator(config, engine, clock);

  auto results = orchestrator.run(artifacts);
  if (!results) {
    labrun::log::error("Run aborted: {}", results.error().message());
    std::println(stderr, "Error: {}", results.error().message());
    return kExitRunFailed;
  }

  labrun::present(*results, stdout);
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::vector<std::string_view> args(argv + 1, argv + argc);

  auto opts = labrun::cli::parse_args(args);
  if (!opts) {
    labrun::cli::print_usage(stderr, argv[0]);
    return kExitUsage;
  }

  if (opts->show_help) {
    labrun::cli::print_usage(stdout, argv[0]);
    return kExitOk;
  }
  if (opts->show_version) {
    labrun::cli::print_version(stdout);
    return kExitOk;
  }

  // Surface config diagnostics before the configured level is known.
  labrun::log::set_level(labrun::log::Level::Warn);

  auto config = labrun::cli::resolve_config(*opts);
  if (!config) {
    std::println(stderr, "Error: invalid configuration: {}",
                 config.error().message());
    return kExitUsage;
  }
  if (opts->artifacts.empty()) {
    std::println(stderr, "Error: no submission given");
    labrun::cli::print_usage(stderr, argv[0]);
    return kExitUsage;
  }

  labrun::log::set_level(config->log_level);
  return run(*config, opts->artifacts);
}
