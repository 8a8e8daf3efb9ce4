#include "test_framework.hpp"

#include "agentfs/tools/approval.hpp"
#include "agentfs/tools/args.hpp"
#include "agentfs/tools/tool_executor.hpp"
#include "agentfs/tools/tool_registry.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>

namespace {

using agentfs::common::ErrorCode;
namespace tools = agentfs::tools;

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

class EchoTool final : public tools::ITool {
public:
  explicit EchoTool(std::string name = "echo", std::string toolkit = "filesystem")
      : name_(std::move(name)), toolkit_(std::move(toolkit)) {}

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] std::string_view description() const override { return "Echo the text argument"; }
  [[nodiscard]] std::string parameters_schema() const override {
    return R"({"type":"object","properties":{"text":{"type":"string"}}})";
  }
  [[nodiscard]] std::string_view toolkit() const override { return toolkit_; }

  [[nodiscard]] agentfs::common::Result<tools::ToolResult>
  execute(const tools::ToolArgs &args, const tools::ToolContext &ctx) override {
    last_operation_key = ctx.operation_key();
    tools::ToolResult result;
    result.output = args.contains("text") ? args.at("text") : "";
    return agentfs::common::Result<tools::ToolResult>::success(std::move(result));
  }

  std::string last_operation_key;

private:
  std::string name_;
  std::string toolkit_;
};

tools::ToolCallRequest request(const std::string &name, tools::ToolArgs args,
                               const std::string &id = "call-1") {
  tools::ToolCallRequest call;
  call.id = id;
  call.name = name;
  call.arguments = std::move(args);
  return call;
}

} // namespace

void register_tools_tests(std::vector<agentfs::tests::TestCase> &tests) {
  using agentfs::tests::require;
  using agentfs::testing::ToolHarness;

  // registry and arguments

  tests.push_back({"registry_lookup_is_case_insensitive_and_replaces", [] {
                     tools::ToolRegistry registry;
                     registry.register_tool(std::make_unique<EchoTool>("Echo"));
                     require(registry.get_tool("echo") != nullptr, "lowercase lookup");
                     require(registry.get_tool("ECHO") != nullptr, "uppercase lookup");
                     registry.register_tool(std::make_unique<EchoTool>("echo", "search"));
                     require(registry.size() == 1, "same name replaces");
                     require(registry.get_tool("echo")->toolkit() == "search", "replacement wins");
                     const auto specs = registry.all_specs();
                     require(specs.size() == 1 && specs[0].toolkit == "search" &&
                                 !specs[0].mutating,
                             "spec carries toolkit and mutating flag");
                   }});

  tests.push_back({"args_typed_lookups", [] {
                     const tools::ToolArgs args{{"flag", "yes"},   {"count", "42"},
                                                {"ratio", "0.5"},  {"bad", "4x"},
                                                {"none", "null"},  {"empty", ""}};
                     require(tools::bool_arg(args, "flag", false).value(), "yes is true");
                     require(tools::int_arg(args, "count", 0).value() == 42, "int parse");
                     require(tools::double_arg(args, "ratio", 0.0).value() == 0.5, "double parse");
                     require(tools::int_arg(args, "none", 7).value() == 7, "null falls back");
                     require(tools::int_arg(args, "missing", 9).value() == 9, "absent falls back");
                     const auto bad = tools::int_arg(args, "bad", 0);
                     require(!bad.ok() && bad.code() == ErrorCode::InvalidArgument,
                             "partial numbers rejected");
                     const auto empty = tools::required_arg(args, "empty");
                     require(!empty.ok() && empty.code() == ErrorCode::InvalidArgument,
                             "empty required argument rejected");
                     require(!tools::check_range("top_k", 0.0, 1.0, 50.0).ok(), "range check");
                   }});

  tests.push_back({"args_from_json_object", [] {
                     const auto parsed =
                         tools::args_from_json(R"({"path":"/a.txt","overwrite":true})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().at("path") == "/a.txt", "path parsed");
                     require(parsed.value().at("overwrite") == "true", "bool kept raw");
                     require(!tools::args_from_json("[1,2]").ok(), "arrays rejected");
                     require(tools::json_quote("a\"b") == R"("a\"b")", "json quoting");
                   }});

  // approval

  tests.push_back({"approval_modes", [] {
                     const agentfs::workspace::ToolPolicy needs{.needs_approval = true};
                     const agentfs::workspace::ToolPolicy unguarded{};
                     require(tools::ApprovalManager(tools::ApprovalMode::Policy).needs_approval(needs),
                             "policy mode follows the policy");
                     require(!tools::ApprovalManager(tools::ApprovalMode::Policy).needs_approval(unguarded),
                             "policy mode skips free tools");
                     require(tools::ApprovalManager(tools::ApprovalMode::Always).needs_approval(unguarded),
                             "always mode asks for everything");
                     require(!tools::ApprovalManager(tools::ApprovalMode::Never).needs_approval(needs),
                             "never mode asks for nothing");
                     require(tools::approval_mode_from_string("ALWAYS") == tools::ApprovalMode::Always,
                             "mode parsing");
                     require(!tools::approval_mode_from_string("maybe").has_value(),
                             "unknown mode rejected");
                   }});

  tests.push_back({"executor_denies_without_approval", [] {
                     ToolHarness h(nullptr, tools::ApprovalMode::Policy);
                     const auto denied = h.call("write_file", {{"path", "/a.txt"}, {"content", "x"}});
                     require(denied.error == ErrorCode::ApprovalDenied, "approval_denied expected");
                     require(!std::filesystem::exists(h.workspace.fs_root() / "a.txt"),
                             "denied tool must not run");
                     const auto listing = h.call("ls", {{"path", "/"}});
                     require(listing.result.success, "tools without approval still run");
                   }});

  tests.push_back({"executor_approval_callback_sees_request", [] {
                     ToolHarness h(nullptr, tools::ApprovalMode::Policy);
                     auto seen = std::make_shared<std::vector<std::string>>();
                     h.executor->set_approval_manager(std::make_shared<tools::ApprovalManager>(
                         tools::ApprovalMode::Policy, [seen](const tools::ApprovalRequest &req) {
                           seen->push_back(req.toolkit + "/" + req.tool + "@" + req.operation_key +
                                           ":" + req.arguments->at("path"));
                           return true;
                         }));
                     const auto granted =
                         h.call("write_file", {{"path", "/a.txt"}, {"content", "x"}}, "op-9");
                     require(granted.result.success, granted.result.output);
                     require(seen->size() == 1 && seen->front() == "filesystem/write_file@op-9:/a.txt",
                             "approval request mismatch");
                   }});

  // executor

  tests.push_back({"executor_unknown_tool", [] {
                     ToolHarness h;
                     const auto result = h.call("teleport", {});
                     require(result.error == ErrorCode::NotFound, "unknown tool is not_found");
                     require(contains(result.result.output, "Unknown tool: teleport"),
                             "error message in output");
                   }});

  tests.push_back({"executor_disabled_tool", [] {
                     ToolHarness h([](agentfs::config::Config &config) {
                       config.tools.toolkits["filesystem"].tools["echo"].enabled = false;
                     });
                     h.registry.register_tool(std::make_unique<EchoTool>());
                     const auto result = h.call("echo", {{"text", "hi"}});
                     require(result.error == ErrorCode::ToolDisabled, "tool_disabled expected");
                     require(contains(result.result.output, "Tool is disabled by policy: echo"),
                             "disabled message");
                   }});

  tests.push_back({"executor_cancelled_before_run", [] {
                     ToolHarness h;
                     auto call = request("ls", {{"path", "/"}});
                     call.context.cancellation.cancel();
                     const auto result = h.executor->execute_one(call);
                     require(result.error == ErrorCode::OperationCancelled, "cancelled");
                     const auto ends = h.observer->events_of<agentfs::observability::ToolEndEvent>();
                     require(ends.size() == 1 && ends[0].error_code == "operation_cancelled",
                             "end event carries the error code");
                   }});

  tests.push_back({"executor_emits_start_and_end_events", [] {
                     ToolHarness h;
                     auto echo = std::make_unique<EchoTool>();
                     auto *raw = echo.get();
                     h.registry.register_tool(std::move(echo));
                     auto call = request("echo", {{"text", "hi"}}, "tc-7");
                     call.context.conversation_id = "conv";
                     const auto result = h.executor->execute_one(call);
                     require(result.result.success && result.result.output == "hi", "echo output");
                     require(result.id == "tc-7" && result.name == "echo", "call identity kept");
                     require(raw->last_operation_key == "conv:tc-7",
                             "tool call id fills the operation key");

                     const auto starts =
                         h.observer->events_of<agentfs::observability::ToolStartEvent>();
                     const auto ends = h.observer->events_of<agentfs::observability::ToolEndEvent>();
                     require(starts.size() == 1 && starts[0].operation_key == "conv:tc-7",
                             "start event");
                     require(ends.size() == 1 && ends[0].success && ends[0].error_code.empty(),
                             "end event");
                   }});

  tests.push_back({"executor_batch_preserves_order", [] {
                     ToolHarness h;
                     h.registry.register_tool(std::make_unique<EchoTool>());
                     std::vector<tools::ToolCallRequest> calls;
                     for (int i = 0; i < 5; ++i) {
                       calls.push_back(
                           request("echo", {{"text", std::to_string(i)}}, "c" + std::to_string(i)));
                     }
                     calls.push_back(request("missing", {}, "c5"));
                     const auto results = h.executor->execute(calls);
                     require(results.size() == 6, "one result per call");
                     for (int i = 0; i < 5; ++i) {
                       require(results[static_cast<std::size_t>(i)].result.output ==
                                   std::to_string(i),
                               "results out of order");
                     }
                     require(results[5].error == ErrorCode::NotFound,
                             "failures stay in their slot");
                   }});

  // sandbox

  tests.push_back({"execute_command_captures_streams", [] {
                     ToolHarness h;
                     const auto out = h.call("execute_command", {{"command", "echo hello"}});
                     require(out.result.success, out.result.output);
                     require(contains(out.result.output, R"("stdout":"hello\n")"),
                             "stdout captured: " + out.result.output);
                     require(contains(out.result.output, R"("exitCode":0)"), "exit code 0");

                     const auto err =
                         h.call("execute_command", {{"command", "echo oops 1>&2; exit 3"}});
                     require(err.result.success, "non-zero exit is still a result");
                     require(contains(err.result.output, R"("stderr":"oops\n")"),
                             "stderr captured: " + err.result.output);
                     require(contains(err.result.output, R"("exitCode":3)"), "exit code 3");
                     require(contains(err.result.output, R"("stdout":"")"), "empty stdout");
                   }});

  tests.push_back({"execute_command_cwd_and_env", [] {
                     ToolHarness h;
                     std::filesystem::create_directories(h.runtime->sandbox_root() / "work");
                     const auto pwd = h.call("execute_command", {{"command", "pwd"}, {"cwd", "work"}});
                     require(contains(pwd.result.output, "/work\\n"),
                             "cwd honored: " + pwd.result.output);
                     const auto env = h.call("execute_command",
                                             {{"command", "printf %s \"$GREETING\""},
                                              {"env", R"({"GREETING":"hi there"})"}});
                     require(contains(env.result.output, R"("stdout":"hi there")"),
                             "env passed: " + env.result.output);
                     const auto escape =
                         h.call("execute_command", {{"command", "pwd"}, {"cwd", "../.."}});
                     require(escape.error == ErrorCode::PathTraversal, "cwd traversal rejected");
                   }});

  tests.push_back({"execute_command_env_overrides_in_parallel_batch", [] {
                     agentfs::testing::EnvGuard color("AGENTFS_TEST_COLOR", "red");
                     ToolHarness h;
                     std::vector<tools::ToolCallRequest> calls;
                     for (int i = 0; i < 4; ++i) {
                       calls.push_back(request(
                           "execute_command",
                           {{"command", "printf %s \"$AGENTFS_TEST_COLOR\""},
                            {"env", R"({"AGENTFS_TEST_COLOR":"blue)" + std::to_string(i) + R"("})"}},
                           "env-" + std::to_string(i)));
                     }
                     calls.push_back(request("execute_command",
                                             {{"command", "printf %s \"$AGENTFS_TEST_COLOR\""}},
                                             "env-inherited"));
                     const auto results = h.executor->execute(calls);
                     require(results.size() == 5, "one result per call");
                     for (int i = 0; i < 4; ++i) {
                       const auto &output = results[static_cast<std::size_t>(i)].result.output;
                       require(contains(output, R"("stdout":"blue)" + std::to_string(i) + R"(")"),
                               "override replaces the inherited value: " + output);
                       require(contains(output, R"("timedOut":false)"), "no hang: " + output);
                     }
                     require(contains(results[4].result.output, R"("stdout":"red")"),
                             "inherited value kept: " + results[4].result.output);
                   }});

  tests.push_back({"execute_command_timeout", [] {
                     ToolHarness h;
                     const auto started = std::chrono::steady_clock::now();
                     const auto out = h.call("execute_command",
                                             {{"command", "sleep 5"}, {"timeout_ms", "200"}});
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(out.result.success, out.result.output);
                     require(contains(out.result.output, R"("timedOut":true)"),
                             "timed out flag: " + out.result.output);
                     require(elapsed < std::chrono::seconds(4), "process killed at the timeout");
                   }});

  tests.push_back({"execute_command_truncates_output", [] {
                     ToolHarness h;
                     const auto out = h.call(
                         "execute_command",
                         {{"command", "head -c 4000 /dev/zero | tr '\\0' a"}, {"max_output_kb", "1"}});
                     require(out.result.success, out.result.output);
                     require(out.result.truncated, "truncated flag set");
                     require(contains(out.result.output, R"("stdoutTruncated":true)"),
                             "stdout truncated");
                     require(contains(out.result.output, "...<truncated>"), "truncation marker");
                     require(out.result.output.size() < 2000, "output bounded");
                   }});

  tests.push_back({"execute_command_cancelled_mid_run", [] {
                     ToolHarness h;
                     auto call = request("execute_command", {{"command", "sleep 5"}});
                     auto token = call.context.cancellation;
                     std::thread canceller([token] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(200));
                       token.cancel();
                     });
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = h.executor->execute_one(call);
                     canceller.join();
                     require(result.error == ErrorCode::OperationCancelled,
                             "cancellation stops the command");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(4),
                             "child killed promptly");
                   }});

  // search

  tests.push_back({"workspace_index_and_search", [] {
                     ToolHarness h;
                     h.workspace.create_file("a.txt", "the cat sat");
                     h.workspace.create_file("b.txt", "a dog ran");
                     {
                       std::ofstream blob(h.workspace.fs_root() / "c.bin", std::ios::binary);
                       blob.write("\0\1\2", 3);
                     }
                     std::filesystem::create_directories(h.workspace.fs_root() / "empty");
                     const auto indexed = h.call("workspace_index", {{"path", "/"}});
                     require(indexed.result.output == R"({"indexed":2,"totalFound":4,"skipped":1})",
                             "index output: " + indexed.result.output);

                     const auto found = h.call("workspace_search",
                                               {{"query", "cat"}, {"mode", "bm25"}});
                     require(found.result.success, found.result.output);
                     require(contains(found.result.output,
                                      R"({"path":"/a.txt","score":1,"scoreDetails":{"bm25":1},"content":"the cat sat","snippet":"the cat sat","lineRange":[1,1]})"),
                             "search output: " + found.result.output);
                     require(!contains(found.result.output, "/b.txt"), "dog file excluded");

                     const auto index_events =
                         h.observer->events_of<agentfs::observability::IndexEvent>();
                     require(index_events.size() == 1 && index_events[0].indexed == 2,
                             "index event");
                     const auto search_events =
                         h.observer->events_of<agentfs::observability::SearchEvent>();
                     require(search_events.size() == 1 && search_events[0].mode == "bm25" &&
                                 search_events[0].results == 1,
                             "search event");
                   }});

  tests.push_back({"workspace_index_content_and_options", [] {
                     ToolHarness h;
                     const auto stored = h.call("workspace_index_content",
                                                {{"path", "notes/zoo"}, {"content", "zebra stripes"}});
                     require(stored.result.output == R"({"indexed":true,"path":"/notes/zoo"})",
                             "index content output: " + stored.result.output);
                     require(h.index->get("/notes/zoo")->source == "manual", "default source");

                     const auto hidden = h.call("workspace_search", {{"query", "zebra"},
                                                                     {"include_content", "false"}});
                     require(hidden.result.success, hidden.result.output);
                     require(contains(hidden.result.output, R"("path":"/notes/zoo")"),
                             "hybrid search hit");
                     require(!contains(hidden.result.output, R"("content":)"),
                             "content omitted on request");

                     const auto empty = h.call("workspace_search", {{"query", "unrelated words"},
                                                                    {"mode", "bm25"}});
                     require(contains(empty.result.output, R"("results":[])"), "no hits");
                   }});

  tests.push_back({"workspace_search_over_empty_document_finds_nothing", [] {
                     ToolHarness h;
                     const auto stored = h.call("workspace_index_content",
                                                {{"path", "/x"}, {"content", ""}});
                     require(stored.result.output == R"({"indexed":true,"path":"/x"})",
                             "index_content output: " + stored.result.output);
                     const auto found = h.call("workspace_search", {{"query", "anything"}});
                     require(found.result.success, found.result.output);
                     require(contains(found.result.output, R"("results":[])"),
                             "an empty document never matches: " + found.result.output);
                   }});

  tests.push_back({"workspace_search_validates_arguments", [] {
                     ToolHarness h;
                     require(h.call("workspace_search", {{"query", "x"}, {"mode", "fuzzy"}}).error ==
                                 ErrorCode::InvalidArgument,
                             "bad mode");
                     require(h.call("workspace_search", {{"query", "x"}, {"min_score", "2"}}).error ==
                                 ErrorCode::InvalidArgument,
                             "min_score range");
                     require(h.call("workspace_search", {{"query", "x"}, {"vector_weight", "-1"}})
                                     .error == ErrorCode::InvalidArgument,
                             "vector_weight range");
                     require(h.call("workspace_search", {{"query", ""}}).error ==
                                 ErrorCode::InvalidArgument,
                             "empty query");
                   }});
}
