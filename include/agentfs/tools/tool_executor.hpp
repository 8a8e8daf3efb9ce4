#pragma once

#include "agentfs/common/error.hpp"
#include "agentfs/observability/observer.hpp"
#include "agentfs/tools/approval.hpp"
#include "agentfs/tools/tool_registry.hpp"
#include "agentfs/workspace/runtime.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentfs::tools {

struct ToolCallRequest {
  std::string id;
  std::string name;
  ToolArgs arguments;
  ToolContext context;
};

struct ToolCallResult {
  std::string id;
  std::string name;
  ToolResult result;
  common::ErrorCode error = common::ErrorCode::None;
};

/// Runs tool calls against one workspace: resolves policy, applies approval,
/// reports start/end events and turns failures into structured results.
class ToolExecutor {
public:
  struct Dependencies {
    std::shared_ptr<ApprovalManager> approval;
    std::shared_ptr<observability::IObserver> observer;
  };

  ToolExecutor(ToolRegistry &registry, std::shared_ptr<workspace::WorkspaceRuntime> runtime,
               Dependencies dependencies = {});

  void set_approval_manager(std::shared_ptr<ApprovalManager> approval);

  [[nodiscard]] ToolCallResult execute_one(const ToolCallRequest &call);

  /// Calls run concurrently; results keep the order of `calls`.
  [[nodiscard]] std::vector<ToolCallResult> execute(const std::vector<ToolCallRequest> &calls);

private:
  [[nodiscard]] ToolCallResult run(const ToolCallRequest &call, const Dependencies &deps);

  ToolRegistry &registry_;
  std::shared_ptr<workspace::WorkspaceRuntime> runtime_;
  std::mutex state_mutex_;
  Dependencies dependencies_;
};

} // namespace agentfs::tools
