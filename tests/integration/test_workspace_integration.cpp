#include "test_framework.hpp"

#include "agentfs/search/factory.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <string>
#include <utility>

namespace {

using agentfs::common::ErrorCode;

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

agentfs::tools::ToolCallRequest call(const std::string &id, const std::string &name,
                                     agentfs::tools::ToolArgs args,
                                     const std::string &conversation) {
  agentfs::tools::ToolCallRequest request;
  request.id = id;
  request.name = name;
  request.arguments = std::move(args);
  request.context.conversation_id = conversation;
  return request;
}

} // namespace

void register_workspace_integration_tests(std::vector<agentfs::tests::TestCase> &tests) {
  using agentfs::tests::require;
  using agentfs::testing::ToolHarness;

  tests.push_back({"integration_agent_edit_session", [] {
                     ToolHarness h;
                     h.workspace.create_file("project/README.md", "# Demo\nstatus: draft\n");
                     h.workspace.create_file("project/src/app.py", "print('hello')\n");

                     const auto tree = h.call("list_tree", {{"path", "/project"}}, "session");
                     require(contains(tree.result.output, R"("/project/src/")"), "tree lists src");

                     require(h.call("read_file", {{"path", "/project/README.md"}}, "session")
                                 .result.success,
                             "read README");
                     const auto edited = h.call("edit_file",
                                                {{"path", "/project/README.md"},
                                                 {"old_string", "draft"},
                                                 {"new_string", "final"}},
                                                "session");
                     require(edited.result.success, edited.result.output);

                     const auto indexed = h.call("workspace_index", {{"path", "/project"}}, "session");
                     require(contains(indexed.result.output, R"("indexed":2)"),
                             "index output: " + indexed.result.output);
                     const auto found = h.call("workspace_search",
                                               {{"query", "final"}, {"mode", "bm25"}}, "session");
                     require(contains(found.result.output, R"("path":"/project/README.md")"),
                             "edited content is searchable: " + found.result.output);
                     require(contains(found.result.output, R"("lineRange":[1,3])"),
                             "snippet around the matching line: " + found.result.output);

                     const auto ends = h.observer->events_of<agentfs::observability::ToolEndEvent>();
                     require(ends.size() == 5, "one end event per call");
                     for (const auto &end : ends) {
                       require(end.success && end.operation_key == "session", "end events");
                     }
                   }});

  tests.push_back({"integration_stale_read_recovery", [] {
                     ToolHarness h;
                     h.workspace.create_file("shared.txt", "counter = 1\n");
                     require(h.call("read_file", {{"path", "/shared.txt"}}, "agent-a").result.success,
                             "agent a reads");
                     require(h.call("read_file", {{"path", "/shared.txt"}}, "agent-b").result.success,
                             "agent b reads");

                     const auto first = h.call("edit_file",
                                               {{"path", "/shared.txt"},
                                                {"old_string", "counter = 1"},
                                                {"new_string", "counter = 20"}},
                                               "agent-a");
                     require(first.result.success, first.result.output);

                     const auto second = h.call("edit_file",
                                                {{"path", "/shared.txt"},
                                                 {"old_string", "counter = 1"},
                                                 {"new_string", "counter = 300"}},
                                                "agent-b");
                     require(second.error == ErrorCode::StaleRead,
                             "agent b must see the concurrent change");
                     require(second.result.metadata.at("recoverable") == "true", "recoverable");

                     const auto reread = h.call("read_file", {{"path", "/shared.txt"}}, "agent-b");
                     require(contains(reread.result.output, "counter = 20"), "fresh content");
                     const auto retried = h.call("edit_file",
                                                 {{"path", "/shared.txt"},
                                                  {"old_string", "counter = 20"},
                                                  {"new_string", "counter = 300"}},
                                                 "agent-b");
                     require(retried.result.success, retried.result.output);
                     require(h.workspace.read_file("shared.txt") == "counter = 300\n",
                             "final content");
                   }});

  tests.push_back({"integration_parallel_calls_are_isolated", [] {
                     ToolHarness h;
                     for (int i = 0; i < 4; ++i) {
                       h.workspace.create_file("f" + std::to_string(i) + ".txt", "v0");
                     }
                     std::vector<agentfs::tools::ToolCallRequest> reads;
                     for (int i = 0; i < 4; ++i) {
                       const std::string file = "/f" + std::to_string(i) + ".txt";
                       reads.push_back(call("r" + std::to_string(i), "read_file", {{"path", file}},
                                            "conv"));
                     }
                     const auto read_results = h.executor->execute(reads);
                     for (const auto &result : read_results) {
                       require(result.result.success, result.result.output);
                     }

                     // reads were keyed by their own tool call ids, so a new call id has no history
                     const auto unread = h.executor->execute_one(
                         call("w0", "delete_file", {{"path", "/f0.txt"}}, "conv"));
                     require(unread.error == ErrorCode::ReadRequired,
                             "operation keys include the tool call id");
                     require(std::filesystem::exists(h.workspace.fs_root() / "f0.txt"),
                             "file kept");
                   }});

  tests.push_back({"integration_sandbox_and_filesystem_roots_are_separate", [] {
                     ToolHarness h;
                     const auto made = h.call("execute_command",
                                              {{"command", "mkdir -p out && echo built > out/log.txt"}});
                     require(made.result.success && contains(made.result.output, R"("exitCode":0)"),
                             made.result.output);
                     require(std::filesystem::exists(h.runtime->sandbox_root() / "out" / "log.txt"),
                             "command wrote into the sandbox root");
                     const auto visible = h.call("stat", {{"path", "/out/log.txt"}});
                     require(visible.error == ErrorCode::NotFound,
                             "sandbox files are not in the filesystem root");
                   }});

  tests.push_back({"integration_sqlite_index_survives_restart", [] {
                     agentfs::testing::TempWorkspace temp;
                     auto config = agentfs::testing::temp_config(temp);
                     config.search.vector_store = "sqlite";
                     {
                       const auto index = agentfs::search::create_search_index(config);
                       require(index.ok(), index.error());
                       const auto stored = index.value()->upsert(agentfs::search::IndexedDocument{
                           .path = "/kb/rust.md", .content = "ownership and borrowing"});
                       require(stored.ok(), stored.error());
                     }
                     const auto reopened = agentfs::search::create_search_index(config);
                     require(reopened.ok(), reopened.error());
                     const auto hits = reopened.value()->search(
                         "ownership borrowing",
                         agentfs::search::SearchOptions{.mode = agentfs::search::SearchMode::Vector});
                     require(hits.ok(), hits.error());
                     require(!hits.value().empty() && hits.value()[0].path == "/kb/rust.md",
                             "vectors persisted across restarts");
                   }});
}
