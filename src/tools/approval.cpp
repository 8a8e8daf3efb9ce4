#include "agentfs/tools/approval.hpp"

#include "agentfs/common/fs.hpp"

namespace agentfs::tools {

std::optional<ApprovalMode> approval_mode_from_string(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  if (lowered == "policy") {
    return ApprovalMode::Policy;
  }
  if (lowered == "always") {
    return ApprovalMode::Always;
  }
  if (lowered == "never") {
    return ApprovalMode::Never;
  }
  return std::nullopt;
}

std::string approval_mode_to_string(const ApprovalMode mode) {
  switch (mode) {
  case ApprovalMode::Policy:
    return "policy";
  case ApprovalMode::Always:
    return "always";
  case ApprovalMode::Never:
    return "never";
  }
  return "policy";
}

ApprovalManager::ApprovalManager(const ApprovalMode mode, ApprovalCallback callback)
    : mode_(mode), callback_(std::move(callback)) {}

bool ApprovalManager::needs_approval(const workspace::ToolPolicy &policy) const {
  if (mode_ == ApprovalMode::Never) {
    return false;
  }
  if (mode_ == ApprovalMode::Always) {
    return true;
  }
  return policy.needs_approval;
}

common::Status ApprovalManager::authorize(const ApprovalRequest &request,
                                          const workspace::ToolPolicy &policy) const {
  if (!needs_approval(policy)) {
    return common::Status::success();
  }
  if (callback_ && callback_(request)) {
    return common::Status::success();
  }
  return common::Status::error("Tool execution denied by approval policy: " + request.tool,
                               common::ErrorCode::ApprovalDenied);
}

} // namespace agentfs::tools
