#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace labrun {

namespace io {
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kInitialOutputReserve = 8192;
}

namespace timing {
inline constexpr auto kDefaultPollInterval = std::chrono::milliseconds(3000);
inline constexpr auto kDefaultTimeout = std::chrono::seconds(300);
// Longest duration that still fits the steady clock's representation.
inline constexpr auto kMaxDuration = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::steady_clock::duration::max());
}

namespace submission {
inline constexpr std::string_view kArchiveSuffix = ".tar.gz";
inline constexpr std::string_view kContainerPath = "/labwork/submission.tar.gz";
inline constexpr std::string_view kRunnerCommand = "labwork-runner";
}

namespace isolation {
inline constexpr std::string_view kDefaultNetwork = "labrun-isolated";
inline constexpr std::string_view kNullDns = "0.0.0.0";
inline constexpr std::string_view kNoSearchDomain = ".";
}

}  // namespace labrun
