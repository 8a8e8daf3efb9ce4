#pragma once

#include "agentfs/common/result.hpp"
#include "agentfs/workspace/operation_context.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace agentfs::tools {

/// Tool arguments as flat key/value strings. Nested values stay raw JSON.
using ToolArgs = std::unordered_map<std::string, std::string>;

using ToolContext = workspace::OperationContext;

struct ToolResult {
  std::string output;
  bool success = true;
  bool truncated = false;
  std::unordered_map<std::string, std::string> metadata;
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::string parameters_json;
  std::string toolkit;
  bool mutating = false;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::string parameters_schema() const = 0;
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  /// Policy namespace: "filesystem", "sandbox" or "search".
  [[nodiscard]] virtual std::string_view toolkit() const = 0;
  [[nodiscard]] virtual bool is_mutating() const { return false; }

  [[nodiscard]] ToolSpec spec() const;
};

/// `{"error":{"code":"stale_read","message":"..."}}`
[[nodiscard]] std::string error_output(const common::Status &status);

[[nodiscard]] ToolResult failure_result(const common::Status &status);

} // namespace agentfs::tools
