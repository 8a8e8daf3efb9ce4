#pragma once

#include "agentfs/tools/tool.hpp"
#include "agentfs/workspace/runtime.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace agentfs::tools {

struct CommandRequest {
  std::string command;
  std::filesystem::path cwd;
  std::unordered_map<std::string, std::string> env;
  std::chrono::milliseconds timeout{10'000};
  std::size_t max_output_bytes = 64 * 1024;
};

struct CommandOutcome {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;
  std::chrono::milliseconds duration{0};
  bool timed_out = false;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
};

/// Runs `/bin/sh -c` in its own process group. Streams longer than
/// `max_output_bytes` are cut and end with "\n...<truncated>". The command is
/// killed on timeout or when `cancellation` fires.
[[nodiscard]] common::Result<CommandOutcome>
run_command(const CommandRequest &request, const workspace::CancellationToken &cancellation);

class ExecuteCommandTool final : public ITool {
public:
  explicit ExecuteCommandTool(std::shared_ptr<workspace::WorkspaceRuntime> runtime);

  [[nodiscard]] std::string_view name() const override { return "execute_command"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
  [[nodiscard]] std::string_view toolkit() const override { return "sandbox"; }
  [[nodiscard]] bool is_mutating() const override { return true; }

private:
  std::shared_ptr<workspace::WorkspaceRuntime> runtime_;
};

} // namespace agentfs::tools
