#pragma once

#include "agentfs/tools/tool.hpp"
#include "agentfs/workspace/runtime.hpp"

#include <memory>

namespace agentfs::tools {

/// Shared plumbing for the filesystem toolkit: cancellation check at entry
/// and the read-only guard for mutating tools.
class FilesystemTool : public ITool {
public:
  explicit FilesystemTool(std::shared_ptr<workspace::WorkspaceRuntime> runtime);

  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) final;
  [[nodiscard]] std::string_view toolkit() const override { return "filesystem"; }

protected:
  [[nodiscard]] virtual common::Result<ToolResult> run(const ToolArgs &args,
                                                       const ToolContext &ctx) = 0;

  /// Enforces read-before-write when this tool's resolved policy asks for it.
  [[nodiscard]] common::Status guard_write(const ToolContext &ctx, const std::string &path) const;

  /// Moves the read baseline to the state this operation just wrote, so a
  /// guarded tool can modify the same file again without a re-read.
  [[nodiscard]] common::Status refresh_read(const ToolContext &ctx,
                                            const std::string &path) const;

  [[nodiscard]] bool requires_read() const;

  std::shared_ptr<workspace::WorkspaceRuntime> runtime_;
};

class LsTool final : public FilesystemTool {
public:
  using FilesystemTool::FilesystemTool;
  [[nodiscard]] std::string_view name() const override { return "ls"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

class ReadFileTool final : public FilesystemTool {
public:
  using FilesystemTool::FilesystemTool;
  [[nodiscard]] std::string_view name() const override { return "read_file"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

class StatTool final : public FilesystemTool {
public:
  using FilesystemTool::FilesystemTool;
  [[nodiscard]] std::string_view name() const override { return "stat"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

class GlobTool final : public FilesystemTool {
public:
  using FilesystemTool::FilesystemTool;
  [[nodiscard]] std::string_view name() const override { return "glob"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

class GrepTool final : public FilesystemTool {
public:
  using FilesystemTool::FilesystemTool;
  [[nodiscard]] std::string_view name() const override { return "grep"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

/// Recursive listing; directories carry a trailing `/`. Also registered as
/// `list_files`.
class ListTreeTool final : public FilesystemTool {
public:
  ListTreeTool(std::shared_ptr<workspace::WorkspaceRuntime> runtime, std::string name);
  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;

private:
  std::string name_;
};

class WriteFileTool final : public FilesystemTool {
public:
  using FilesystemTool::FilesystemTool;
  [[nodiscard]] std::string_view name() const override { return "write_file"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] bool is_mutating() const override { return true; }

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

class EditFileTool final : public FilesystemTool {
public:
  using FilesystemTool::FilesystemTool;
  [[nodiscard]] std::string_view name() const override { return "edit_file"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] bool is_mutating() const override { return true; }

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

class DeleteFileTool final : public FilesystemTool {
public:
  using FilesystemTool::FilesystemTool;
  [[nodiscard]] std::string_view name() const override { return "delete_file"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] bool is_mutating() const override { return true; }

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

class MkdirTool final : public FilesystemTool {
public:
  using FilesystemTool::FilesystemTool;
  [[nodiscard]] std::string_view name() const override { return "mkdir"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] bool is_mutating() const override { return true; }

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

class RmdirTool final : public FilesystemTool {
public:
  using FilesystemTool::FilesystemTool;
  [[nodiscard]] std::string_view name() const override { return "rmdir"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] bool is_mutating() const override { return true; }

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

} // namespace agentfs::tools
