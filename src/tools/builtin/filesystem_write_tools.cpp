#include "agentfs/tools/builtin/filesystem.hpp"

#include "builtin_internal.hpp"

namespace agentfs::tools {

namespace {

using builtin_internal::bool_json;
using builtin_internal::json_result;

common::Result<std::string> normalized_path_arg(const ToolArgs &args) {
  auto raw = required_arg(args, "path");
  if (!raw.ok()) {
    return raw;
  }
  return workspace::WorkspaceRuntime::normalize_path(raw.value());
}

/// Present but possibly empty string argument.
common::Result<std::string> text_arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end()) {
    return common::Result<std::string>::failure("Missing argument: " + name,
                                                common::ErrorCode::InvalidArgument);
  }
  return common::Result<std::string>::success(it->second);
}

ToolResult path_result(const std::string &path, const std::string &field, const bool value) {
  return json_result(R"({"path":)" + json_quote(path) + R"(,")" + field +
                     R"(":)" + bool_json(value) + "}");
}

} // namespace

// write_file

std::string_view WriteFileTool::description() const {
  return "Write a file into the workspace filesystem.";
}

std::string WriteFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path","content"],"properties":{"path":{"type":"string","description":"Workspace file path starting with /"},"content":{"type":"string","description":"File contents"},"overwrite":{"type":"boolean","default":false,"description":"Overwrite if the file exists"},"create_parent_dirs":{"type":"boolean","default":true,"description":"Create parent directories if missing"}}})";
}

common::Result<ToolResult> WriteFileTool::run(const ToolArgs &args, const ToolContext &ctx) {
  auto path = normalized_path_arg(args);
  if (!path.ok()) {
    return common::Result<ToolResult>::propagate(path);
  }
  auto content = text_arg(args, "content");
  if (!content.ok()) {
    return common::Result<ToolResult>::propagate(content);
  }
  auto overwrite = bool_arg(args, "overwrite", false);
  if (!overwrite.ok()) {
    return common::Result<ToolResult>::propagate(overwrite);
  }
  auto create_parents = bool_arg(args, "create_parent_dirs", true);
  if (!create_parents.ok()) {
    return common::Result<ToolResult>::propagate(create_parents);
  }

  if (auto guarded = guard_write(ctx, path.value()); !guarded.ok()) {
    return common::Result<ToolResult>::propagate(guarded);
  }

  auto &fs = runtime_->filesystem();
  bool exists = false;
  if (auto existing = fs.stat(path.value()); existing.ok()) {
    if (existing.value().is_dir) {
      return common::Result<ToolResult>::failure("Path is a directory: " + path.value(),
                                                  common::ErrorCode::InvalidArgument);
    }
    exists = true;
  } else if (existing.code() != common::ErrorCode::NotFound) {
    return common::Result<ToolResult>::propagate(existing);
  }
  if (exists && !overwrite.value()) {
    return common::Result<ToolResult>::failure("File already exists: " + path.value(),
                                                common::ErrorCode::AlreadyExists);
  }

  if (auto written = fs.write(path.value(), content.value(), create_parents.value());
      !written.ok()) {
    return common::Result<ToolResult>::propagate(written);
  }
  if (auto refreshed = refresh_read(ctx, path.value()); !refreshed.ok()) {
    return common::Result<ToolResult>::propagate(refreshed);
  }
  return common::Result<ToolResult>::success(path_result(path.value(), "overwritten", exists));
}

// edit_file

std::string_view EditFileTool::description() const {
  return "Edit a file by replacing a specific string.";
}

std::string EditFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path","old_string","new_string"],"properties":{"path":{"type":"string","description":"Workspace file path starting with /"},"old_string":{"type":"string","description":"Exact string to replace"},"new_string":{"type":"string","description":"Replacement string"},"replace_all":{"type":"boolean","default":false,"description":"Replace all occurrences"}}})";
}

common::Result<ToolResult> EditFileTool::run(const ToolArgs &args, const ToolContext &ctx) {
  auto path = normalized_path_arg(args);
  if (!path.ok()) {
    return common::Result<ToolResult>::propagate(path);
  }
  auto old_string = required_arg(args, "old_string");
  if (!old_string.ok()) {
    return common::Result<ToolResult>::propagate(old_string);
  }
  auto new_string = text_arg(args, "new_string");
  if (!new_string.ok()) {
    return common::Result<ToolResult>::propagate(new_string);
  }
  auto replace_all = bool_arg(args, "replace_all", false);
  if (!replace_all.ok()) {
    return common::Result<ToolResult>::propagate(replace_all);
  }

  if (auto guarded = guard_write(ctx, path.value()); !guarded.ok()) {
    return common::Result<ToolResult>::propagate(guarded);
  }
  auto edited = runtime_->filesystem().edit(path.value(), old_string.value(), new_string.value(),
                                            replace_all.value());
  if (!edited.ok()) {
    return common::Result<ToolResult>::propagate(edited);
  }
  if (auto refreshed = refresh_read(ctx, path.value()); !refreshed.ok()) {
    return common::Result<ToolResult>::propagate(refreshed);
  }
  return common::Result<ToolResult>::success(
      json_result(R"({"path":)" + json_quote(path.value()) + R"(,"occurrences":)" +
                  std::to_string(edited.value().occurrences) + "}"));
}

// delete_file

std::string_view DeleteFileTool::description() const {
  return "Delete a file or directory from the workspace filesystem.";
}

std::string DeleteFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string","description":"Workspace path starting with /"},"recursive":{"type":"boolean","default":false,"description":"Delete directories recursively"}}})";
}

common::Result<ToolResult> DeleteFileTool::run(const ToolArgs &args, const ToolContext &ctx) {
  auto path = normalized_path_arg(args);
  if (!path.ok()) {
    return common::Result<ToolResult>::propagate(path);
  }
  auto recursive = bool_arg(args, "recursive", false);
  if (!recursive.ok()) {
    return common::Result<ToolResult>::propagate(recursive);
  }

  if (auto guarded = guard_write(ctx, path.value()); !guarded.ok()) {
    return common::Result<ToolResult>::propagate(guarded);
  }
  if (auto removed = runtime_->filesystem().remove(path.value(), recursive.value());
      !removed.ok()) {
    return common::Result<ToolResult>::propagate(removed);
  }
  return common::Result<ToolResult>::success(path_result(path.value(), "deleted", true));
}

// mkdir

std::string_view MkdirTool::description() const {
  return "Create a directory in the workspace filesystem.";
}

std::string MkdirTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string","description":"Workspace directory path starting with /"},"recursive":{"type":"boolean","default":true}}})";
}

common::Result<ToolResult> MkdirTool::run(const ToolArgs &args, const ToolContext &) {
  auto path = normalized_path_arg(args);
  if (!path.ok()) {
    return common::Result<ToolResult>::propagate(path);
  }
  auto recursive = bool_arg(args, "recursive", true);
  if (!recursive.ok()) {
    return common::Result<ToolResult>::propagate(recursive);
  }
  if (auto created = runtime_->filesystem().mkdir(path.value(), recursive.value());
      !created.ok()) {
    return common::Result<ToolResult>::propagate(created);
  }
  return common::Result<ToolResult>::success(path_result(path.value(), "created", true));
}

// rmdir

std::string_view RmdirTool::description() const {
  return "Remove a directory from the workspace filesystem.";
}

std::string RmdirTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string","description":"Workspace directory path starting with /"},"recursive":{"type":"boolean","default":false}}})";
}

common::Result<ToolResult> RmdirTool::run(const ToolArgs &args, const ToolContext &) {
  auto path = normalized_path_arg(args);
  if (!path.ok()) {
    return common::Result<ToolResult>::propagate(path);
  }
  auto recursive = bool_arg(args, "recursive", false);
  if (!recursive.ok()) {
    return common::Result<ToolResult>::propagate(recursive);
  }

  auto &fs = runtime_->filesystem();
  auto info = fs.stat(path.value());
  if (!info.ok()) {
    if (info.code() == common::ErrorCode::NotFound) {
      return common::Result<ToolResult>::success(path_result(path.value(), "deleted", false));
    }
    return common::Result<ToolResult>::propagate(info);
  }
  if (!info.value().is_dir) {
    return common::Result<ToolResult>::failure("Not a directory: " + path.value(),
                                                common::ErrorCode::InvalidArgument);
  }
  if (auto removed = fs.remove(path.value(), recursive.value()); !removed.ok()) {
    return common::Result<ToolResult>::propagate(removed);
  }
  return common::Result<ToolResult>::success(path_result(path.value(), "deleted", true));
}

} // namespace agentfs::tools
