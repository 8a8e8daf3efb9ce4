#include "test_framework.hpp"

#include "agentfs/workspace/operation_context.hpp"
#include "agentfs/workspace/path_sandbox.hpp"
#include "agentfs/workspace/read_tracker.hpp"
#include "agentfs/workspace/runtime.hpp"
#include "agentfs/workspace/tool_policy.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <map>

namespace {

using agentfs::common::ErrorCode;
using agentfs::workspace::ReadVersion;

/// In-memory version table standing in for file stats.
struct FakeFiles {
  std::map<std::string, ReadVersion> versions;

  agentfs::workspace::VersionProbe probe() {
    return [this](const std::string &path) -> std::optional<ReadVersion> {
      const auto it = versions.find(path);
      if (it == versions.end()) {
        return std::nullopt;
      }
      return it->second;
    };
  }
};

struct ManualClock {
  std::chrono::steady_clock::time_point now{};

  std::function<std::chrono::steady_clock::time_point()> fn() {
    return [this] { return now; };
  }
};

} // namespace

void register_workspace_tests(std::vector<agentfs::tests::TestCase> &tests) {
  using agentfs::tests::require;
  namespace ws = agentfs::workspace;

  tests.push_back({"sandbox_normalize_prefixes_slash", [] {
                     const auto a = ws::PathSandbox::normalize("a/b");
                     require(a.ok() && a.value() == "/a/b", "a/b should become /a/b");
                     const auto win = ws::PathSandbox::normalize("dir\\file.txt");
                     require(win.ok() && win.value() == "/dir/file.txt", "backslashes converted");
                     const auto root = ws::PathSandbox::normalize("/");
                     require(root.ok() && root.value() == "/", "root stays root");
                   }});

  tests.push_back({"sandbox_keeps_surrounding_spaces", [] {
                     const auto spaced = ws::PathSandbox::normalize(" notes.txt ");
                     require(spaced.ok() && spaced.value() == "/ notes.txt ",
                             "spaces are part of the name: " + spaced.value());
                     agentfs::testing::TempWorkspace temp;
                     temp.create_file(" notes.txt ", "padded");
                     const ws::PathSandbox sandbox(temp.fs_root());
                     const auto host = sandbox.resolve_to_host("/ notes.txt ");
                     require(host.ok(), host.error());
                     require(std::filesystem::exists(host.value()), "padded file addressable");
                   }});

  tests.push_back({"sandbox_normalize_rejects_traversal", [] {
                     const auto parent = ws::PathSandbox::normalize("../etc/passwd");
                     require(!parent.ok(), "parent traversal should fail");
                     require(parent.code() == ErrorCode::PathTraversal, "path_traversal code");
                     const auto home = ws::PathSandbox::normalize("~/.ssh/id_rsa");
                     require(!home.ok() && home.code() == ErrorCode::PathTraversal,
                             "home expansion should fail");
                     const auto nested = ws::PathSandbox::normalize("/a/../../b");
                     require(!nested.ok(), "embedded .. should fail");
                   }});

  tests.push_back({"sandbox_resolve_inside_root", [] {
                     agentfs::testing::TempWorkspace temp;
                     const ws::PathSandbox sandbox(temp.fs_root());
                     const auto host = sandbox.resolve_to_host("/docs/a.md");
                     require(host.ok(), host.error());
                     require(host.value() == (temp.fs_root() / "docs" / "a.md").lexically_normal(),
                             "unexpected host path: " + host.value().string());
                     const auto root = sandbox.resolve_to_host("/");
                     require(root.ok() && root.value() == sandbox.root(), "root resolves to root");
                     const auto back = sandbox.to_workspace_path(host.value());
                     require(back.ok() && back.value() == "/docs/a.md", "inverse mapping");
                   }});

  tests.push_back({"sandbox_resolve_rejects_escape", [] {
                     agentfs::testing::TempWorkspace temp;
                     const ws::PathSandbox sandbox(temp.fs_root());
                     const auto escaped = sandbox.resolve_to_host("//etc/passwd");
                     require(!escaped.ok(), "absolute host path should escape");
                     require(escaped.code() == ErrorCode::PathEscape, "path_escape code");
                     const auto outside = sandbox.to_workspace_path("/etc/passwd");
                     require(!outside.ok() && outside.code() == ErrorCode::PathEscape,
                             "inverse mapping outside root");
                   }});

  tests.push_back({"policy_merge_tool_overrides_defaults", [] {
                     agentfs::config::ToolkitPolicies table;
                     table["filesystem"].defaults.needs_approval = true;
                     table["filesystem"].defaults.require_read_before_write = true;
                     table["filesystem"].tools["ls"].needs_approval = false;
                     const ws::ToolPolicyResolver resolver(table);

                     const auto ls = resolver.policy_for("filesystem", "ls");
                     require(ls.enabled, "unset enabled means enabled");
                     require(!ls.needs_approval, "tool entry wins");
                     require(ls.require_read_before_write, "default field kept");

                     const auto other = resolver.policy_for("filesystem", "grep");
                     require(other.needs_approval, "defaults apply to unlisted tools");

                     const auto unknown = resolver.policy_for("nope", "tool");
                     require(unknown.enabled && !unknown.needs_approval &&
                                 !unknown.require_read_before_write,
                             "unknown toolkit resolves to permissive defaults");
                   }});

  tests.push_back({"policy_disabled_toolkit", [] {
                     agentfs::config::ToolkitPolicies table;
                     table["sandbox"].defaults.enabled = false;
                     table["sandbox"].tools["execute_command"].needs_approval = true;
                     const ws::ToolPolicyResolver resolver(table);
                     const auto merged = resolver.merged("sandbox", "execute_command");
                     require(merged.enabled == false, "disabled default carries through");
                     require(!resolver.policy_for("sandbox", "execute_command").enabled,
                             "resolved policy disabled");
                   }});

  tests.push_back({"operation_context_key", [] {
                     ws::OperationContext ctx;
                     require(ctx.operation_key() == "unknown:unknown", "fallback key");
                     ctx.conversation_id = "conv";
                     ctx.tool_call_id = "call-1";
                     require(ctx.operation_key() == "conv:call-1", "composed key");
                     ctx.operation_id = "op";
                     require(ctx.operation_key() == "op", "operation id wins");
                   }});

  tests.push_back({"operation_context_cancellation_and_deadline", [] {
                     ws::OperationContext ctx;
                     require(ctx.check_active().ok(), "fresh context is active");
                     require(!ctx.remaining().has_value(), "no deadline means no remaining");

                     auto copy = ctx;
                     ctx.cancellation.cancel();
                     const auto status = copy.check_active();
                     require(!status.ok(), "copies share the cancellation flag");
                     require(status.code() == ErrorCode::OperationCancelled, "cancelled code");

                     ws::OperationContext expired;
                     expired.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);
                     require(expired.check_active().code() == ErrorCode::OperationCancelled,
                             "past deadline is cancelled");
                     require(expired.remaining() == std::chrono::milliseconds(0),
                             "remaining clamps to zero");
                   }});

  tests.push_back({"read_tracker_requires_read", [] {
                     FakeFiles files;
                     files.versions["/a.txt"] = ReadVersion{.modified_at_nanos = 1, .size_bytes = 3};
                     ws::ReadTracker tracker(files.probe());
                     const auto status = tracker.assert_read_before_write("op", "/a.txt");
                     require(status.code() == ErrorCode::ReadRequired, "read_required expected");
                     tracker.record_read("op", "/a.txt");
                     require(tracker.assert_read_before_write("op", "/a.txt").ok(),
                             "read then write should pass");
                     require(tracker.assert_read_before_write("other", "/a.txt").code() ==
                                 ErrorCode::ReadRequired,
                             "reads are scoped per operation");
                   }});

  tests.push_back({"read_tracker_detects_stale_read", [] {
                     FakeFiles files;
                     files.versions["/a.txt"] = ReadVersion{.modified_at_nanos = 1, .size_bytes = 3};
                     ws::ReadTracker tracker(files.probe());
                     tracker.record_read("op", "/a.txt");
                     files.versions["/a.txt"] = ReadVersion{.modified_at_nanos = 2, .size_bytes = 3};
                     const auto status = tracker.assert_read_before_write("op", "/a.txt");
                     require(status.code() == ErrorCode::StaleRead, "stale_read expected");

                     tracker.record_read("op", "/a.txt");
                     require(tracker.assert_read_before_write("op", "/a.txt").ok(),
                             "re-reading refreshes the baseline");

                     files.versions.erase("/a.txt");
                     require(tracker.assert_read_before_write("op", "/a.txt").code() ==
                                 ErrorCode::StaleRead,
                             "deleted file is stale");
                   }});

  tests.push_back({"read_tracker_ignores_missing_files", [] {
                     FakeFiles files;
                     ws::ReadTracker tracker(files.probe());
                     tracker.record_read("op", "/missing.txt");
                     require(tracker.tracked_operations() == 0, "nothing recorded");
                   }});

  tests.push_back({"read_tracker_ttl_expiry", [] {
                     FakeFiles files;
                     files.versions["/a.txt"] = ReadVersion{.modified_at_nanos = 1, .size_bytes = 1};
                     ManualClock clock;
                     ws::ReadTracker tracker(files.probe(),
                                             ws::ReadTrackerOptions{.ttl = std::chrono::seconds(10),
                                                                    .max_operations = 0,
                                                                    .clock = clock.fn()});
                     tracker.record_read("op", "/a.txt");
                     clock.now += std::chrono::seconds(5);
                     require(tracker.assert_read_before_write("op", "/a.txt").ok(),
                             "within ttl");
                     clock.now += std::chrono::seconds(11);
                     require(tracker.assert_read_before_write("op", "/a.txt").code() ==
                                 ErrorCode::ReadRequired,
                             "expired operation forgets its reads");
                     require(tracker.tracked_operations() == 0, "expired entry evicted");
                   }});

  tests.push_back({"read_tracker_lru_bound", [] {
                     FakeFiles files;
                     files.versions["/a.txt"] = ReadVersion{.modified_at_nanos = 1, .size_bytes = 1};
                     ws::ReadTracker tracker(
                         files.probe(),
                         ws::ReadTrackerOptions{.ttl = std::chrono::seconds(0), .max_operations = 2});
                     tracker.record_read("op-1", "/a.txt");
                     tracker.record_read("op-2", "/a.txt");
                     require(tracker.assert_read_before_write("op-1", "/a.txt").ok(),
                             "touch op-1 so op-2 is least recent");
                     tracker.record_read("op-3", "/a.txt");
                     require(tracker.tracked_operations() == 2, "bounded to two operations");
                     require(tracker.assert_read_before_write("op-2", "/a.txt").code() ==
                                 ErrorCode::ReadRequired,
                             "least recently used operation evicted");
                     require(tracker.assert_read_before_write("op-1", "/a.txt").ok(),
                             "recent operation kept");
                   }});

  tests.push_back({"read_tracker_forget_and_clear", [] {
                     FakeFiles files;
                     files.versions["/a.txt"] = ReadVersion{.modified_at_nanos = 1, .size_bytes = 1};
                     ws::ReadTracker tracker(files.probe());
                     tracker.record_read("op-1", "/a.txt");
                     tracker.record_read("op-2", "/a.txt");
                     tracker.forget("op-1");
                     require(tracker.tracked_operations() == 1, "forget drops one operation");
                     tracker.clear();
                     require(tracker.tracked_operations() == 0, "clear drops everything");
                   }});

  tests.push_back({"runtime_init_creates_roots", [] {
                     agentfs::testing::TempWorkspace temp;
                     auto config = agentfs::testing::temp_config(temp);
                     config.workspace.filesystem_root = (temp.path() / "fresh-fs").string();
                     ws::WorkspaceRuntime runtime(config);
                     require(!runtime.initialized(), "not initialized before init");
                     const auto status = runtime.init();
                     require(status.ok(), status.error());
                     require(std::filesystem::is_directory(temp.path() / "fresh-fs"),
                             "filesystem root created");
                     require(std::filesystem::is_directory(temp.path() / "sandbox"),
                             "sandbox root created");
                     require(runtime.initialized(), "initialized after init");
                     runtime.destroy();
                     require(!runtime.initialized(), "destroy resets state");
                   }});

  tests.push_back({"runtime_seeds_skills_once", [] {
                     agentfs::testing::TempWorkspace temp;
                     const auto seed = temp.path() / "seed";
                     std::filesystem::create_directories(seed / "pdf");
                     {
                       std::ofstream out(seed / "pdf" / "SKILL.md");
                       out << "# pdf";
                     }
                     auto config = agentfs::testing::temp_config(temp);
                     config.workspace.skills_seed_dir = seed.string();
                     auto runtime = agentfs::testing::make_runtime(config);
                     require(temp.read_file("skills/pdf/SKILL.md") == "# pdf", "skills seeded");

                     temp.create_file("skills/pdf/SKILL.md", "# edited");
                     auto again = agentfs::testing::make_runtime(config);
                     require(temp.read_file("skills/pdf/SKILL.md") == "# edited",
                             "existing skills are not overwritten");
                   }});

  tests.push_back({"runtime_sandbox_cwd", [] {
                     agentfs::testing::TempWorkspace temp;
                     auto runtime =
                         agentfs::testing::make_runtime(agentfs::testing::temp_config(temp));
                     const auto root = runtime->resolve_sandbox_cwd(std::nullopt);
                     require(root.ok() && root.value() == runtime->sandbox_root(),
                             "default cwd is the sandbox root");
                     const auto nested = runtime->resolve_sandbox_cwd("build");
                     require(nested.ok() && nested.value() == runtime->sandbox_root() / "build",
                             "relative cwd resolves under the sandbox");
                     const auto bad = runtime->resolve_sandbox_cwd("../x");
                     require(!bad.ok() && bad.code() == ErrorCode::PathTraversal,
                             "traversal rejected for cwd");
                   }});

  tests.push_back({"runtime_with_deadline_keeps_existing", [] {
                     agentfs::testing::TempWorkspace temp;
                     auto config = agentfs::testing::temp_config(temp);
                     config.workspace.operation_timeout_ms = 1000;
                     auto runtime = agentfs::testing::make_runtime(config);
                     const auto stamped = runtime->with_deadline({});
                     require(stamped.deadline.has_value(), "deadline stamped");
                     ws::OperationContext preset;
                     const auto fixed = std::chrono::steady_clock::now() + std::chrono::hours(1);
                     preset.deadline = fixed;
                     require(runtime->with_deadline(preset).deadline == fixed,
                             "existing deadline kept");
                   }});

  tests.push_back({"runtime_read_tracking_over_real_files", [] {
                     agentfs::testing::TempWorkspace temp;
                     temp.create_file("notes.txt", "one");
                     auto runtime =
                         agentfs::testing::make_runtime(agentfs::testing::temp_config(temp));
                     require(runtime->record_read("op", "notes.txt").ok(), "record read");
                     require(runtime->assert_read_before_write("op", "/notes.txt").ok(),
                             "relative and absolute paths share a key");
                     temp.create_file("notes.txt", "one plus more");
                     require(runtime->assert_read_before_write("op", "/notes.txt").code() ==
                                 ErrorCode::StaleRead,
                             "external change detected");
                     require(runtime->record_read("op", "../x").code() == ErrorCode::PathTraversal,
                             "record_read validates paths");
                   }});
}
