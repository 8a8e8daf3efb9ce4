#include "agentfs/tools/builtin/filesystem.hpp"

#include "builtin_internal.hpp"

#include <functional>
#include <sstream>

namespace agentfs::tools {

namespace {

using builtin_internal::bool_json;
using builtin_internal::file_list_json;
using builtin_internal::json_result;

constexpr std::int64_t kDefaultTreeDepth = 4;
constexpr std::int64_t kMaxTreeDepth = 20;

common::Result<std::string> normalized_path_arg(const ToolArgs &args, const std::string &name) {
  auto raw = required_arg(args, name);
  if (!raw.ok()) {
    return raw;
  }
  return workspace::WorkspaceRuntime::normalize_path(raw.value());
}

} // namespace

FilesystemTool::FilesystemTool(std::shared_ptr<workspace::WorkspaceRuntime> runtime)
    : runtime_(std::move(runtime)) {}

common::Result<ToolResult> FilesystemTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  if (!runtime_) {
    return common::Result<ToolResult>::failure("workspace runtime unavailable",
                                                common::ErrorCode::Config);
  }
  if (const auto active = ctx.check_active(); !active.ok()) {
    return common::Result<ToolResult>::propagate(active);
  }
  if (is_mutating() && runtime_->read_only()) {
    return common::Result<ToolResult>::failure("Workspace filesystem is read-only",
                                                common::ErrorCode::ToolDisabled);
  }
  return run(args, ctx);
}

bool FilesystemTool::requires_read() const {
  return runtime_->policy(std::string(toolkit()), std::string(name())).require_read_before_write;
}

common::Status FilesystemTool::guard_write(const ToolContext &ctx, const std::string &path) const {
  if (!requires_read()) {
    return common::Status::success();
  }
  return runtime_->assert_read_before_write(workspace::WorkspaceRuntime::operation_key(ctx), path);
}

common::Status FilesystemTool::refresh_read(const ToolContext &ctx,
                                            const std::string &path) const {
  if (!requires_read()) {
    return common::Status::success();
  }
  return runtime_->record_read(workspace::WorkspaceRuntime::operation_key(ctx), path);
}

// ls

std::string_view LsTool::description() const {
  return "List files and directories in a workspace directory.";
}

std::string LsTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string","description":"Workspace path starting with /"}}})";
}

common::Result<ToolResult> LsTool::run(const ToolArgs &args, const ToolContext &) {
  auto path = normalized_path_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::propagate(path);
  }
  auto listing = runtime_->filesystem().ls_info(path.value());
  if (!listing.ok()) {
    return common::Result<ToolResult>::propagate(listing);
  }
  return common::Result<ToolResult>::success(
      json_result(R"({"path":)" + json_quote(path.value()) + R"(,"entries":)" +
                  file_list_json(listing.value()) + "}"));
}

// read_file

std::string_view ReadFileTool::description() const {
  return "Read a text file from the workspace filesystem.";
}

std::string ReadFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string","description":"Workspace file path starting with /"},"offset":{"type":"integer","minimum":0,"description":"0-based line offset"},"limit":{"type":"integer","minimum":1,"description":"Max lines to read"}}})";
}

common::Result<ToolResult> ReadFileTool::run(const ToolArgs &args, const ToolContext &ctx) {
  auto path = normalized_path_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::propagate(path);
  }
  auto offset = int_arg(args, "offset", 0);
  if (!offset.ok()) {
    return common::Result<ToolResult>::propagate(offset);
  }
  auto limit = int_arg(args, "limit", 0);
  if (!limit.ok()) {
    return common::Result<ToolResult>::propagate(limit);
  }
  if (offset.value() < 0) {
    return common::Result<ToolResult>::failure("Argument offset must be non-negative",
                                                common::ErrorCode::InvalidArgument);
  }
  // 0 is the "absent" sentinel from int_arg
  const bool has_limit = limit.value() != 0;
  if (limit.value() < 0) {
    return common::Result<ToolResult>::failure("Argument limit must be positive",
                                                common::ErrorCode::InvalidArgument);
  }

  workspace::ReadWindow window;
  window.offset = static_cast<std::size_t>(offset.value());
  if (has_limit) {
    window.limit = static_cast<std::size_t>(limit.value());
  }
  // version first: a write racing the read must not become the baseline
  const auto version = runtime_->capture_version(path.value());
  if (!version.ok()) {
    return common::Result<ToolResult>::propagate(version);
  }
  auto content = runtime_->filesystem().read(path.value(), window);
  if (!content.ok()) {
    return common::Result<ToolResult>::propagate(content);
  }

  if (version.value().has_value()) {
    if (auto recorded = runtime_->record_read(workspace::WorkspaceRuntime::operation_key(ctx),
                                              path.value(), *version.value());
        !recorded.ok()) {
      return common::Result<ToolResult>::propagate(recorded);
    }
  }
  return common::Result<ToolResult>::success(
      json_result(R"({"path":)" + json_quote(path.value()) + R"(,"content":)" +
                  json_quote(content.value()) + "}"));
}

// stat

std::string_view StatTool::description() const {
  return "Get metadata for a workspace file or directory.";
}

std::string StatTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string","description":"Workspace path starting with /"}}})";
}

common::Result<ToolResult> StatTool::run(const ToolArgs &args, const ToolContext &) {
  auto path = normalized_path_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::propagate(path);
  }
  auto info = runtime_->filesystem().stat(path.value());
  if (!info.ok()) {
    return common::Result<ToolResult>::propagate(info);
  }
  return common::Result<ToolResult>::success(
      json_result(builtin_internal::file_info_json(info.value())));
}

// glob

std::string_view GlobTool::description() const {
  return "Find files in the workspace filesystem matching a glob pattern.";
}

std::string GlobTool::parameters_schema() const {
  return R"({"type":"object","required":["pattern"],"properties":{"pattern":{"type":"string","description":"Glob pattern, e.g. **/*.md"},"path":{"type":"string","description":"Workspace directory to search under"}}})";
}

common::Result<ToolResult> GlobTool::run(const ToolArgs &args, const ToolContext &) {
  auto pattern = required_arg(args, "pattern");
  if (!pattern.ok()) {
    return common::Result<ToolResult>::propagate(pattern);
  }
  auto matches =
      runtime_->filesystem().glob_info(pattern.value(), optional_arg(args, "path").value_or("/"));
  if (!matches.ok()) {
    return common::Result<ToolResult>::propagate(matches);
  }
  return common::Result<ToolResult>::success(
      json_result(R"({"pattern":)" + json_quote(pattern.value()) + R"(,"matches":)" +
                  file_list_json(matches.value()) + "}"));
}

// grep

std::string_view GrepTool::description() const {
  return "Search for a regex pattern in workspace files.";
}

std::string GrepTool::parameters_schema() const {
  return R"({"type":"object","required":["pattern"],"properties":{"pattern":{"type":"string","description":"Regex pattern"},"path":{"type":"string","description":"Workspace directory to search"},"glob":{"type":"string","description":"Glob filter, e.g. **/*.ts"}}})";
}

common::Result<ToolResult> GrepTool::run(const ToolArgs &args, const ToolContext &) {
  auto pattern = required_arg(args, "pattern");
  if (!pattern.ok()) {
    return common::Result<ToolResult>::propagate(pattern);
  }
  auto matches = runtime_->filesystem().grep_raw(
      pattern.value(), optional_arg(args, "path").value_or("/"), optional_arg(args, "glob"));
  if (!matches.ok()) {
    return common::Result<ToolResult>::propagate(matches);
  }

  std::ostringstream out;
  out << R"({"pattern":)" << json_quote(pattern.value()) << R"(,"matches":[)";
  for (std::size_t i = 0; i < matches.value().size(); ++i) {
    const auto &match = matches.value()[i];
    if (i > 0) {
      out << ",";
    }
    out << R"({"path":)" << json_quote(match.path) << R"(,"line":)" << match.line
        << R"(,"text":)" << json_quote(match.text) << "}";
  }
  out << "]}";
  return common::Result<ToolResult>::success(json_result(out.str()));
}

// list_tree / list_files

ListTreeTool::ListTreeTool(std::shared_ptr<workspace::WorkspaceRuntime> runtime, std::string name)
    : FilesystemTool(std::move(runtime)), name_(std::move(name)) {}

std::string_view ListTreeTool::description() const {
  return name_ == "list_tree" ? "List files and directories recursively."
                              : "Alias for list_tree.";
}

std::string ListTreeTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string","description":"Workspace directory path starting with /"},"max_depth":{"type":"integer","minimum":0,"maximum":20,"default":4}}})";
}

common::Result<ToolResult> ListTreeTool::run(const ToolArgs &args, const ToolContext &ctx) {
  auto path = normalized_path_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::propagate(path);
  }
  auto max_depth = int_arg(args, "max_depth", kDefaultTreeDepth);
  if (!max_depth.ok()) {
    return common::Result<ToolResult>::propagate(max_depth);
  }
  if (auto in_range = check_range("max_depth", static_cast<double>(max_depth.value()), 0,
                                  static_cast<double>(kMaxTreeDepth));
      !in_range.ok()) {
    return common::Result<ToolResult>::propagate(in_range);
  }

  std::ostringstream entries;
  bool first = true;
  std::function<common::Status(const std::string &, std::int64_t)> walk =
      [&](const std::string &dir, const std::int64_t depth) -> common::Status {
    if (depth > max_depth.value()) {
      return common::Status::success();
    }
    if (auto active = ctx.check_active(); !active.ok()) {
      return active;
    }
    auto listing = runtime_->filesystem().ls_info(dir);
    if (!listing.ok()) {
      return listing.status();
    }
    for (const auto &entry : listing.value()) {
      entries << (first ? "" : ",") << R"({"path":)"
              << json_quote(entry.is_dir ? entry.path + "/" : entry.path) << R"(,"is_dir":)"
              << bool_json(entry.is_dir) << "}";
      first = false;
      if (entry.is_dir) {
        if (auto nested = walk(entry.path, depth + 1); !nested.ok()) {
          return nested;
        }
      }
    }
    return common::Status::success();
  };

  if (auto walked = walk(path.value(), 0); !walked.ok()) {
    return common::Result<ToolResult>::propagate(walked);
  }
  return common::Result<ToolResult>::success(json_result(
      R"({"path":)" + json_quote(path.value()) + R"(,"entries":[)" + entries.str() + "]}"));
}

} // namespace agentfs::tools
