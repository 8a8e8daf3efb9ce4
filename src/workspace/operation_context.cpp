#include "agentfs/workspace/operation_context.hpp"

namespace agentfs::workspace {

std::string OperationContext::operation_key() const {
  if (operation_id.has_value() && !operation_id->empty()) {
    return *operation_id;
  }
  return conversation_id.value_or("unknown") + ":" + tool_call_id.value_or("unknown");
}

common::Status OperationContext::check_active() const {
  if (cancellation.is_cancelled()) {
    return common::Status::error("Operation has been cancelled",
                                 common::ErrorCode::OperationCancelled);
  }
  if (deadline.has_value() && std::chrono::steady_clock::now() >= *deadline) {
    return common::Status::error("Operation timed out", common::ErrorCode::OperationCancelled);
  }
  return common::Status::success();
}

std::optional<std::chrono::milliseconds> OperationContext::remaining() const {
  if (!deadline.has_value()) {
    return std::nullopt;
  }
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      *deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

} // namespace agentfs::workspace
