#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace labrun::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "info") return Level::Info;
  if (name == "warn") return Level::Warn;
  if (name == "error") return Level::Error;
  return std::nullopt;
}

// -v count: 0 warn, 1 info, 2+ debug
[[nodiscard]] constexpr auto level_from_verbosity(int verbosity) noexcept
    -> Level {
  if (verbosity <= 0) return Level::Warn;
  if (verbosity == 1) return Level::Info;
  return Level::Debug;
}

// Synchronous logger writing to stderr. stdout is reserved for results.
class Logger {
  Level level_{Level::Warn};
  std::FILE* sink_{stderr};
  std::mutex mutex_;

public:
  Logger() = default;

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    std::scoped_lock lock(mutex_);
    level_ = level;
  }

  [[nodiscard]] auto level() noexcept -> Level {
    std::scoped_lock lock(mutex_);
    return level_;
  }

  auto set_sink(std::FILE* sink) noexcept -> void {
    std::scoped_lock lock(mutex_);
    sink_ = sink;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    std::scoped_lock lock(mutex_);
    if (level < level_)
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    std::print(sink_, "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
               level_color(level), level_name(level), "\033[0m", tid,
               std::format(fmt, std::forward<Args>(args)...));
    std::fflush(sink_);
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace labrun::log
