#pragma once

#include "agentfs/common/json_util.hpp"
#include "agentfs/tools/args.hpp"
#include "agentfs/tools/tool.hpp"
#include "agentfs/workspace/filesystem_backend.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace agentfs::tools::builtin_internal {

inline ToolResult json_result(std::string json) {
  ToolResult result;
  result.output = std::move(json);
  return result;
}

inline const char *bool_json(const bool value) { return value ? "true" : "false"; }

/// ISO-8601 UTC for a nanosecond file time as produced by `workspace::to_nanos`.
inline std::string format_file_time(const std::int64_t nanos) {
  using std::chrono::file_clock;
  const file_clock::time_point file_time(
      std::chrono::duration_cast<file_clock::duration>(std::chrono::nanoseconds(nanos)));
  const auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      file_clock::to_sys(file_time));
  const std::time_t t = std::chrono::system_clock::to_time_t(system_time);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

inline std::string file_info_json(const workspace::FileInfo &info) {
  std::ostringstream out;
  out << R"({"path":)" << json_quote(info.path) << R"(,"is_dir":)" << bool_json(info.is_dir)
      << R"(,"size":)" << info.size << R"(,"modified_at":)"
      << json_quote(format_file_time(info.modified_at_nanos)) << "}";
  return out.str();
}

inline std::string file_list_json(const std::vector<workspace::FileInfo> &entries) {
  std::string out = "[";
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += file_info_json(entries[i]);
  }
  out += "]";
  return out;
}

} // namespace agentfs::tools::builtin_internal
