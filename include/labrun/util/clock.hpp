#pragma once

#include <chrono>
#include <thread>

namespace labrun {

using TimePoint = std::chrono::steady_clock::time_point;

class IClock {
public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual auto now() const -> TimePoint = 0;
  virtual auto sleep_for(std::chrono::milliseconds duration) -> void = 0;
};

class SteadyClock final : public IClock {
public:
  [[nodiscard]] auto now() const -> TimePoint override {
    return std::chrono::steady_clock::now();
  }

  auto sleep_for(std::chrono::milliseconds duration) -> void override {
    std::this_thread::sleep_for(duration);
  }
};

}  // namespace labrun
