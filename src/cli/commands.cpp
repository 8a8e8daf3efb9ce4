#include "agentfs/cli/commands.hpp"

#include "agentfs/common/fs.hpp"
#include "agentfs/config/config.hpp"
#include "agentfs/observability/factory.hpp"
#include "agentfs/search/factory.hpp"
#include "agentfs/tools/args.hpp"
#include "agentfs/tools/tool_executor.hpp"
#include "agentfs/tools/toolkits.hpp"
#include "agentfs/workspace/runtime.hpp"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace agentfs::cli {

namespace {

std::string version_string() {
#ifdef AGENTFS_VERSION
  const std::string version = AGENTFS_VERSION;
#else
  const std::string version = "0.1.0";
#endif
  return "agentfs " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

/// Everything one CLI invocation needs, wired from the loaded config.
struct Session {
  config::Config config;
  std::shared_ptr<workspace::WorkspaceRuntime> runtime;
  std::shared_ptr<search::HybridSearchIndex> index;
  std::unique_ptr<tools::ToolRegistry> registry;
  std::unique_ptr<tools::ToolExecutor> executor;
};

common::Result<std::unique_ptr<Session>> open_session(const bool auto_approve) {
  using SessionResult = common::Result<std::unique_ptr<Session>>;
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return SessionResult::propagate(cfg);
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return SessionResult::propagate(warnings);
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "[WARN] " << warning << "\n";
  }

  auto session = std::make_unique<Session>();
  session->config = std::move(cfg.value());
  std::shared_ptr<observability::IObserver> observer =
      observability::create_observer(session->config);
  session->runtime = std::make_shared<workspace::WorkspaceRuntime>(session->config, observer);
  if (auto ready = session->runtime->init(); !ready.ok()) {
    return SessionResult::propagate(ready);
  }

  auto index = search::create_search_index(session->config);
  if (!index.ok()) {
    return SessionResult::propagate(index);
  }
  session->index = index.value();

  session->registry = std::make_unique<tools::ToolRegistry>(tools::create_workspace_registry(
      session->runtime, session->index,
      tools::SearchToolDefaults{.top_k = session->config.search.default_top_k,
                                .vector_weight = session->config.search.default_vector_weight}));

  const auto mode = tools::approval_mode_from_string(session->config.approval.mode)
                        .value_or(tools::ApprovalMode::Policy);
  tools::ApprovalCallback callback;
  if (auto_approve) {
    callback = [](const tools::ApprovalRequest &) { return true; };
  }
  session->executor = std::make_unique<tools::ToolExecutor>(
      *session->registry, session->runtime,
      tools::ToolExecutor::Dependencies{
          .approval = std::make_shared<tools::ApprovalManager>(mode, std::move(callback)),
          .observer = observer});
  return SessionResult::success(std::move(session));
}

/// Prints the tool output (JSON) and maps success to an exit code.
int invoke(Session &session, const std::string &tool, tools::ToolArgs args) {
  tools::ToolCallRequest request;
  request.id = "cli-" + tool;
  request.name = tool;
  request.arguments = std::move(args);
  request.context.operation_id = "cli";
  const auto result = session.executor->execute_one(request);
  if (result.result.success) {
    std::cout << result.result.output << "\n";
    return 0;
  }
  std::cerr << result.result.output << "\n";
  return 1;
}

int run_index(std::vector<std::string> args) {
  tools::ToolArgs tool_args;
  std::string value;
  if (take_option(args, "--glob", "-g", value)) {
    tool_args["glob"] = value;
  }
  if (take_option(args, "--max-files", "", value)) {
    tool_args["max_files"] = value;
  }
  tool_args["path"] = args.empty() ? "/" : args[0];

  auto session = open_session(false);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  return invoke(*session.value(), "workspace_index", std::move(tool_args));
}

int run_index_content(std::vector<std::string> args) {
  tools::ToolArgs tool_args;
  std::string value;
  if (take_option(args, "--source", "-s", value)) {
    tool_args["source"] = value;
  }
  if (args.size() < 2) {
    std::cerr << "usage: agentfs index-content <path> <text|-> [--source S]\n";
    return 1;
  }
  tool_args["path"] = args[0];
  tool_args["content"] = args[1] == "-" ? read_stdin_all() : join_tokens(args, 1);

  auto session = open_session(false);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  return invoke(*session.value(), "workspace_index_content", std::move(tool_args));
}

int run_search(std::vector<std::string> args) {
  tools::ToolArgs tool_args;
  std::string value;
  if (take_option(args, "--mode", "-m", value)) {
    tool_args["mode"] = value;
  }
  if (take_option(args, "--top-k", "-k", value)) {
    tool_args["top_k"] = value;
  }
  if (take_option(args, "--min-score", "", value)) {
    tool_args["min_score"] = value;
  }
  if (take_option(args, "--vector-weight", "", value)) {
    tool_args["vector_weight"] = value;
  }
  if (take_option(args, "--snippet-length", "", value)) {
    tool_args["snippet_length"] = value;
  }
  std::string index_path = "/";
  if (take_option(args, "--index-path", "", value)) {
    index_path = value;
  }
  if (take_flag(args, "--no-content")) {
    tool_args["include_content"] = "false";
  }
  if (args.empty()) {
    std::cerr << "usage: agentfs search <query> [--mode bm25|vector|hybrid] [--top-k K]\n";
    return 1;
  }
  tool_args["query"] = join_tokens(args);

  auto session = open_session(false);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }

  // The lexical index lives in memory, so build it in this process first.
  tools::ToolCallRequest index_request;
  index_request.id = "cli-index";
  index_request.name = "workspace_index";
  index_request.arguments = {{"path", index_path}};
  index_request.context.operation_id = "cli";
  const auto indexed = session.value()->executor->execute_one(index_request);
  if (!indexed.result.success) {
    std::cerr << indexed.result.output << "\n";
    return 1;
  }
  return invoke(*session.value(), "workspace_search", std::move(tool_args));
}

int run_tools() {
  auto session = open_session(false);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  const auto &runtime = *session.value()->runtime;
  for (const auto &spec : session.value()->registry->all_specs()) {
    const auto policy = runtime.policy(spec.toolkit, spec.name);
    std::cout << spec.toolkit << "/" << spec.name;
    if (policy.needs_approval) {
      std::cout << " [approval]";
    }
    if (policy.require_read_before_write) {
      std::cout << " [read-before-write]";
    }
    std::cout << "  " << spec.description << "\n";
  }
  return 0;
}

int run_call(std::vector<std::string> args) {
  const bool auto_approve = take_flag(args, "--yes") || take_flag(args, "-y");
  tools::ToolArgs tool_args;
  std::string json;
  if (take_option(args, "--json", "", json)) {
    auto parsed = tools::args_from_json(json);
    if (!parsed.ok()) {
      std::cerr << parsed.error() << "\n";
      return 1;
    }
    tool_args = std::move(parsed.value());
  }
  if (args.empty()) {
    std::cerr << "usage: agentfs call <tool> [key=value ...] [--json OBJECT] [--yes]\n";
    return 1;
  }
  const std::string tool = args[0];
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto eq = args[i].find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "invalid argument (expected key=value): " << args[i] << "\n";
      return 1;
    }
    tool_args[args[i].substr(0, eq)] = args[i].substr(eq + 1);
  }

  auto session = open_session(auto_approve);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  return invoke(*session.value(), tool, std::move(tool_args));
}

int run_config(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }
  if (args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (args[0] == "validate") {
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "[FAIL] " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "[WARN] " << warning << "\n";
    }
    std::cout << "[OK] configuration is valid\n";
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  agentfs [--config PATH] <command> [options]\n\n";
  std::cout << "SEARCH\n";
  std::cout << "  index [PATH] [--glob G] [--max-files N]       Index workspace files\n";
  std::cout << "  index-content <PATH> <TEXT|-> [--source S]   Index raw content\n";
  std::cout << "  search <QUERY> [--mode M] [--top-k K] [--min-score S]\n";
  std::cout << "         [--vector-weight W] [--no-content] [--index-path P]\n\n";
  std::cout << "TOOLS\n";
  std::cout << "  tools                                        List available tools\n";
  std::cout << "  call <TOOL> [key=value ...] [--json OBJ] [--yes]\n\n";
  std::cout << "CONFIG\n";
  std::cout << "  config show|validate|path\n";
  std::cout << "  version | help\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = argc > 1 ? collect_args(argc - 1, argv + 1)
                                           : std::vector<std::string>{};
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "index") {
    return run_index(std::move(args));
  }
  if (subcommand == "index-content") {
    return run_index_content(std::move(args));
  }
  if (subcommand == "search") {
    return run_search(std::move(args));
  }
  if (subcommand == "tools") {
    return run_tools();
  }
  if (subcommand == "call") {
    return run_call(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace agentfs::cli
