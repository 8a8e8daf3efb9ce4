#include "agentfs/tools/tool_executor.hpp"

#include <chrono>
#include <future>

namespace agentfs::tools {

namespace {

ToolCallResult failed(ToolCallResult out, const common::Status &status) {
  out.result = failure_result(status);
  out.error = status.code();
  return out;
}

} // namespace

ToolExecutor::ToolExecutor(ToolRegistry &registry,
                           std::shared_ptr<workspace::WorkspaceRuntime> runtime,
                           Dependencies dependencies)
    : registry_(registry), runtime_(std::move(runtime)), dependencies_(std::move(dependencies)) {
  if (!dependencies_.approval) {
    dependencies_.approval = std::make_shared<ApprovalManager>();
  }
  if (!dependencies_.observer && runtime_) {
    dependencies_.observer = runtime_->shared_observer();
  }
}

void ToolExecutor::set_approval_manager(std::shared_ptr<ApprovalManager> approval) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  dependencies_.approval = std::move(approval);
}

ToolCallResult ToolExecutor::execute_one(const ToolCallRequest &call) {
  Dependencies deps;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    deps = dependencies_;
  }
  return run(call, deps);
}

std::vector<ToolCallResult> ToolExecutor::execute(const std::vector<ToolCallRequest> &calls) {
  std::vector<std::future<ToolCallResult>> futures;
  futures.reserve(calls.size());
  for (const auto &call : calls) {
    futures.push_back(std::async(std::launch::async, [this, call]() { return execute_one(call); }));
  }

  std::vector<ToolCallResult> results;
  results.reserve(calls.size());
  for (auto &future : futures) {
    results.push_back(future.get());
  }
  return results;
}

ToolCallResult ToolExecutor::run(const ToolCallRequest &call, const Dependencies &deps) {
  ToolCallResult out;
  out.id = call.id;
  out.name = call.name;

  ITool *tool = registry_.get_tool(call.name);
  if (tool == nullptr) {
    return failed(std::move(out), common::Status::error("Unknown tool: " + call.name,
                                                        common::ErrorCode::NotFound));
  }
  if (!runtime_) {
    return failed(std::move(out), common::Status::error("Workspace runtime unavailable",
                                                        common::ErrorCode::Config));
  }

  ToolContext ctx = runtime_->with_deadline(call.context);
  if (!ctx.tool_call_id.has_value() && !call.id.empty()) {
    ctx.tool_call_id = call.id;
  }
  const std::string operation_key = workspace::WorkspaceRuntime::operation_key(ctx);
  const std::string toolkit(tool->toolkit());
  const std::string name(tool->name());

  const auto notify = [&deps](const observability::ObserverEvent &event) {
    if (deps.observer) {
      deps.observer->record_event(event);
    }
  };

  notify(observability::ToolStartEvent{.tool = name, .operation_key = operation_key});
  const auto started = std::chrono::steady_clock::now();

  const auto finish = [&](ToolCallResult result) {
    notify(observability::ToolEndEvent{
        .tool = name,
        .operation_key = operation_key,
        .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started),
        .success = result.result.success,
        .error_code = result.error == common::ErrorCode::None
                          ? std::string()
                          : common::error_code_to_string(result.error)});
    return result;
  };

  if (const auto active = ctx.check_active(); !active.ok()) {
    return finish(failed(std::move(out), active));
  }

  const auto policy = runtime_->policy(toolkit, name);
  if (!policy.enabled) {
    return finish(failed(std::move(out),
                         common::Status::error("Tool is disabled by policy: " + name,
                                               common::ErrorCode::ToolDisabled)));
  }

  const ApprovalRequest approval_request{.tool = name,
                                         .toolkit = toolkit,
                                         .operation_key = operation_key,
                                         .arguments = &call.arguments};
  if (const auto approved = deps.approval->authorize(approval_request, policy); !approved.ok()) {
    return finish(failed(std::move(out), approved));
  }

  auto result = tool->execute(call.arguments, ctx);
  if (!result.ok()) {
    return finish(failed(std::move(out), result.status()));
  }
  out.result = std::move(result.value());
  return finish(std::move(out));
}

} // namespace agentfs::tools
