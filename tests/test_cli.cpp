#include "test_framework.hpp"

#include "agentfs/cli/commands.hpp"
#include "agentfs/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

/// Swaps std::cout/std::cerr for string buffers while alive.
class StreamCapture {
public:
  StreamCapture()
      : old_out_(std::cout.rdbuf(out_.rdbuf())), old_err_(std::cerr.rdbuf(err_.rdbuf())) {}
  ~StreamCapture() {
    std::cout.rdbuf(old_out_);
    std::cerr.rdbuf(old_err_);
  }

  StreamCapture(const StreamCapture &) = delete;
  StreamCapture &operator=(const StreamCapture &) = delete;

  [[nodiscard]] std::string out() const { return out_.str(); }
  [[nodiscard]] std::string err() const { return err_.str(); }

private:
  std::ostringstream out_;
  std::ostringstream err_;
  std::streambuf *old_out_;
  std::streambuf *old_err_;
};

CliRun run_cli(const std::vector<std::string> &args) {
  std::vector<std::string> owned = args;
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }
  CliRun run;
  {
    StreamCapture capture;
    run.code = agentfs::cli::run_cli(static_cast<int>(argv.size()), argv.data());
    run.out = capture.out();
    run.err = capture.err();
  }
  agentfs::config::clear_config_path_override();
  return run;
}

/// Config file rooted in the temp workspace with logging off.
std::string write_config(const agentfs::testing::TempWorkspace &temp) {
  const auto path = temp.path() / "agentfs.toml";
  std::ofstream out(path);
  out << "[workspace]\n"
      << "id = \"cli\"\n"
      << "root = \"" << temp.path().string() << "\"\n"
      << "filesystem_root = \"" << temp.fs_root().string() << "\"\n"
      << "\n[search]\n"
      << "embedding_provider = \"local\"\n"
      << "embedding_dimensions = 32\n"
      << "vector_store = \"memory\"\n"
      << "\n[observability]\n"
      << "backend = \"none\"\n";
  return path.string();
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_cli_tests(std::vector<agentfs::tests::TestCase> &tests) {
  using agentfs::tests::require;
  using agentfs::testing::TempWorkspace;

  tests.push_back({"cli_version_and_help", [] {
                     const auto version = run_cli({"agentfs", "version"});
                     require(version.code == 0, "version should succeed");
                     require(contains(version.out, "agentfs "), "version string: " + version.out);
                     const auto help = run_cli({"agentfs", "--help"});
                     require(help.code == 0 && contains(help.out, "USAGE"), "help text");
                     const auto unknown = run_cli({"agentfs", "frobnicate"});
                     require(unknown.code == 1, "unknown command fails");
                     require(contains(unknown.err, "Unknown command: frobnicate"),
                             "unknown command message");
                   }});

  tests.push_back({"cli_config_commands", [] {
                     TempWorkspace temp;
                     const auto config_path = write_config(temp);
                     const auto validate =
                         run_cli({"agentfs", "--config", config_path, "config", "validate"});
                     require(validate.code == 0, "validate should pass: " + validate.err);
                     require(contains(validate.out, "[OK] configuration is valid"), "ok line");

                     const auto show = run_cli({"agentfs", "config", "show", "--config=" + config_path});
                     require(show.code == 0 && contains(show.out, "id = \"cli\""),
                             "show renders the file: " + show.out);

                     const auto path = run_cli({"agentfs", "--config", config_path, "config", "path"});
                     require(path.code == 0 && contains(path.out, "agentfs.toml"), "config path");

                     const auto missing = run_cli({"agentfs", "--config"});
                     require(missing.code == 1 && contains(missing.err, "missing value"),
                             "--config needs a value");
                   }});

  tests.push_back({"cli_config_validate_reports_errors", [] {
                     TempWorkspace temp;
                     const auto bad = temp.path() / "bad.toml";
                     {
                       std::ofstream out(bad);
                       out << "[workspace]\nroot = \"" << temp.path().string()
                           << "\"\n[search]\nvector_store = \"redis\"\n";
                     }
                     const auto result =
                         run_cli({"agentfs", "--config", bad.string(), "config", "validate"});
                     require(result.code == 1, "invalid config fails");
                     require(contains(result.err, "Invalid search.vector_store"),
                             "error names the field: " + result.err);
                   }});

  tests.push_back({"cli_tools_lists_policies", [] {
                     TempWorkspace temp;
                     const auto config_path = write_config(temp);
                     const auto result = run_cli({"agentfs", "--config", config_path, "tools"});
                     require(result.code == 0, result.err);
                     require(contains(result.out, "filesystem/edit_file [approval] [read-before-write]"),
                             "edit_file tags: " + result.out);
                     require(contains(result.out, "sandbox/execute_command [approval]"),
                             "sandbox tags");
                     require(contains(result.out, "search/workspace_search  "), "search tools");
                   }});

  tests.push_back({"cli_call_requires_approval_flag", [] {
                     TempWorkspace temp;
                     const auto config_path = write_config(temp);
                     const auto denied = run_cli({"agentfs", "--config", config_path, "call",
                                                  "write_file", "path=/a.txt", "content=hi"});
                     require(denied.code == 1, "write without --yes is denied");
                     require(contains(denied.err, "approval_denied"), "denial code: " + denied.err);

                     const auto granted = run_cli({"agentfs", "--config", config_path, "call",
                                                   "write_file", "path=/a.txt", "content=hi", "--yes"});
                     require(granted.code == 0, "write with --yes: " + granted.err);
                     require(temp.read_file("a.txt") == "hi", "file written");

                     const auto read = run_cli({"agentfs", "--config", config_path, "call",
                                                "read_file", "--json", R"({"path":"/a.txt"})"});
                     require(read.code == 0, read.err);
                     require(contains(read.out, R"({"path":"/a.txt","content":"hi"})"),
                             "read output: " + read.out);
                   }});

  tests.push_back({"cli_index_and_search", [] {
                     TempWorkspace temp;
                     const auto config_path = write_config(temp);
                     temp.create_file("pets/cat.md", "the cat sat on the mat");
                     temp.create_file("pets/dog.md", "the dog chased a ball");

                     const auto indexed = run_cli({"agentfs", "--config", config_path, "index"});
                     require(indexed.code == 0, indexed.err);
                     require(contains(indexed.out, R"("indexed":2)"), "index output: " + indexed.out);

                     const auto found = run_cli({"agentfs", "--config", config_path, "search", "cat",
                                                 "--mode", "bm25", "--no-content"});
                     require(found.code == 0, found.err);
                     require(contains(found.out, R"("path":"/pets/cat.md")"),
                             "search output: " + found.out);
                     require(!contains(found.out, "/pets/dog.md"), "dog not matched");
                     require(!contains(found.out, R"("content":)"), "--no-content honored");

                     const auto usage = run_cli({"agentfs", "--config", config_path, "search"});
                     require(usage.code == 1, "search without query fails");
                   }});
}
