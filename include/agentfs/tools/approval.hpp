#pragma once

#include "agentfs/common/result.hpp"
#include "agentfs/tools/tool.hpp"
#include "agentfs/workspace/tool_policy.hpp"

#include <functional>
#include <optional>
#include <string>

namespace agentfs::tools {

enum class ApprovalMode {
  Policy, // ask only when the resolved policy says so
  Always,
  Never,
};

[[nodiscard]] std::optional<ApprovalMode> approval_mode_from_string(const std::string &value);
[[nodiscard]] std::string approval_mode_to_string(ApprovalMode mode);

struct ApprovalRequest {
  std::string tool;
  std::string toolkit;
  std::string operation_key;
  const ToolArgs *arguments = nullptr;
};

/// Returns true to grant the call.
using ApprovalCallback = std::function<bool(const ApprovalRequest &)>;

class ApprovalManager {
public:
  explicit ApprovalManager(ApprovalMode mode = ApprovalMode::Policy,
                           ApprovalCallback callback = nullptr);

  [[nodiscard]] bool needs_approval(const workspace::ToolPolicy &policy) const;

  /// Without a callback every call that needs approval is denied.
  [[nodiscard]] common::Status authorize(const ApprovalRequest &request,
                                         const workspace::ToolPolicy &policy) const;

  [[nodiscard]] ApprovalMode mode() const { return mode_; }

private:
  ApprovalMode mode_;
  ApprovalCallback callback_;
};

} // namespace agentfs::tools
