#pragma once

#include "labrun/core/error.hpp"

#include <string>
#include <vector>

namespace labrun {

struct ProcessOptions {
  // Send the child's stderr into the stdout pipe so both arrive interleaved
  // in the order the child wrote them.
  bool merge_stderr{false};
};

struct ProcessResult {
  int exit_code{-1};
  std::string stdout_output;
  std::string stderr_output;
};

// Runs argv[0] (looked up on PATH) to completion, blocking the caller.
// Exec failure shows up as exit code 127, signals as 128 + signo.
[[nodiscard]] auto run_process(const std::vector<std::string>& argv,
                               ProcessOptions options = {})
    -> Result<ProcessResult>;

}  // namespace labrun
