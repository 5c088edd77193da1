#include "labrun/runner/presenter.hpp"

#include <format>
#include <iterator>
#include <string_view>

namespace labrun {

namespace {

constexpr std::string_view kRecordDelimiter =
    "========================================================================";
constexpr std::string_view kLogDelimiter =
    "------------------------------------------------------------------------";
constexpr char kRecordTerminator = '\n';

}  // namespace

auto format_result(const FinishedInstance& result) -> std::string {
  std::string out;
  out.reserve(result.log.size() + 512);

  std::format_to(std::back_inserter(out), "{}\n", kRecordDelimiter);
  std::format_to(std::back_inserter(out), "Submission:  {}\n",
                 result.instance.source_path.string());
  std::format_to(std::back_inserter(out), "Container:   {}\n",
                 result.instance.container_id);
  std::format_to(std::back_inserter(out), "Exit reason: {}\n",
                 to_string_view(result.exit_reason));
  std::format_to(std::back_inserter(out), "Return code: {}\n",
                 result.return_code);
  std::format_to(std::back_inserter(out), "{}\n", kLogDelimiter);

  // The log bytes follow the delimiter unchanged. A record always ends in a
  // line break so the next record's delimiter starts a fresh line; when the
  // log lacks a trailing newline that break is a separator, not log output.
  out.append(result.log);
  if (!result.log.empty() && result.log.back() != '\n') {
    out.push_back(kRecordTerminator);
  }
  return out;
}

auto present(std::span<const FinishedInstance> results, std::FILE* out)
    -> void {
  for (const auto& result : results) {
    auto text = format_result(result);
    std::fwrite(text.data(), 1, text.size(), out);
  }
  std::fflush(out);
}

}  // namespace labrun
