#pragma once

#include "labrun/runner/instance.hpp"

#include <cstdio>
#include <span>
#include <string>

namespace labrun {

[[nodiscard]] auto format_result(const FinishedInstance& result) -> std::string;

// Writes every record, in order, to `out`.
auto present(std::span<const FinishedInstance> results, std::FILE* out) -> void;

}  // namespace labrun
