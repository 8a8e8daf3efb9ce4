#pragma once

#include "agentfs/common/result.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace agentfs::workspace {

/// Shared liveness flag. Copies observe the same state.
class CancellationToken {
public:
  CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { cancelled_->store(true); }
  [[nodiscard]] bool is_cancelled() const { return cancelled_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

/// Per-call context passed explicitly through every tool invocation.
struct OperationContext {
  std::optional<std::string> operation_id;
  std::optional<std::string> conversation_id;
  std::optional<std::string> tool_call_id;
  CancellationToken cancellation;
  std::optional<std::chrono::steady_clock::time_point> deadline;

  /// Operation id, or `<conversation|unknown>:<tool call|unknown>`.
  [[nodiscard]] std::string operation_key() const;

  /// Fails with OperationCancelled once cancelled or past the deadline.
  [[nodiscard]] common::Status check_active() const;

  [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;
};

} // namespace agentfs::workspace
