#include "agentfs/tools/builtin/sandbox.hpp"

#include "builtin_internal.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <string_view>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace agentfs::tools {

namespace {

using builtin_internal::bool_json;
using builtin_internal::json_result;

constexpr const char *kTruncatedMarker = "\n...<truncated>";
constexpr std::int64_t kDefaultTimeoutMs = 10'000;
constexpr std::int64_t kDefaultMaxOutputKb = 64;

struct StreamCapture {
  int fd = -1;
  std::string text;
  bool truncated = false;
  bool open = true;
};

void append_capped(StreamCapture &capture, const char *data, const std::size_t size,
                   const std::size_t cap) {
  const std::size_t remaining = cap > capture.text.size() ? cap - capture.text.size() : 0;
  const std::size_t to_copy = std::min(remaining, size);
  capture.text.append(data, to_copy);
  if (to_copy < size) {
    capture.truncated = true;
  }
}

/// Reads whatever is available; marks the stream closed at EOF.
void pump(StreamCapture &capture, const std::size_t cap) {
  std::array<char, 4096> buffer{};
  while (capture.open) {
    const ssize_t bytes = read(capture.fd, buffer.data(), buffer.size());
    if (bytes > 0) {
      append_capped(capture, buffer.data(), static_cast<std::size_t>(bytes), cap);
      continue;
    }
    if (bytes == 0) {
      capture.open = false;
    } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      capture.open = false;
    }
    break;
  }
}

/// Inherited environment with `overrides` applied, as `KEY=VALUE` entries.
std::vector<std::string> build_environment(const std::unordered_map<std::string, std::string> &overrides) {
  std::vector<std::string> entries;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string_view text(*entry);
    const auto eq = text.find('=');
    if (eq != std::string_view::npos && overrides.contains(std::string(text.substr(0, eq)))) {
      continue;
    }
    entries.emplace_back(text);
  }
  for (const auto &[key, value] : overrides) {
    entries.push_back(key + "=" + value);
  }
  return entries;
}

std::string finish_stream(const StreamCapture &capture) {
  return capture.truncated ? capture.text + kTruncatedMarker : capture.text;
}

} // namespace

common::Result<CommandOutcome> run_command(const CommandRequest &request,
                                           const workspace::CancellationToken &cancellation) {
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0) {
    return common::Result<CommandOutcome>::failure("Failed to create pipe");
  }
  if (pipe(err_pipe) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    return common::Result<CommandOutcome>::failure("Failed to create pipe");
  }

  // the child only calls async-signal-safe functions, so everything is built here
  const auto environment = build_environment(request.env);
  std::vector<char *> envp;
  envp.reserve(environment.size() + 1);
  for (const auto &entry : environment) {
    envp.push_back(const_cast<char *>(entry.c_str()));
  }
  envp.push_back(nullptr);

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    for (const int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
      close(fd);
    }
    return common::Result<CommandOutcome>::failure("Failed to fork");
  }

  if (pid == 0) {
    setpgid(0, 0);
    close(out_pipe[0]);
    close(err_pipe[0]);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[1]);
    close(err_pipe[1]);

    if (!request.cwd.empty() && chdir(request.cwd.c_str()) != 0) {
      _exit(126);
    }
    execle("/bin/sh", "sh", "-c", request.command.c_str(), static_cast<char *>(nullptr),
           envp.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  std::array<StreamCapture, 2> streams{StreamCapture{.fd = out_pipe[0]},
                                       StreamCapture{.fd = err_pipe[0]}};
  for (const auto &stream : streams) {
    const int flags = fcntl(stream.fd, F_GETFL, 0);
    fcntl(stream.fd, F_SETFL, flags | O_NONBLOCK);
  }

  CommandOutcome outcome;
  bool cancelled = false;
  bool exited = false;
  int status = 0;
  while (!exited) {
    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > request.timeout || cancellation.is_cancelled()) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      outcome.timed_out = !cancellation.is_cancelled();
      cancelled = !outcome.timed_out;
      break;
    }

    std::array<pollfd, 2> fds{};
    for (std::size_t i = 0; i < streams.size(); ++i) {
      fds[i] = pollfd{.fd = streams[i].open ? streams[i].fd : -1, .events = POLLIN, .revents = 0};
    }
    (void)poll(fds.data(), fds.size(), 50);
    for (auto &stream : streams) {
      pump(stream, request.max_output_bytes);
    }

    if (waitpid(pid, &status, WNOHANG) == pid) {
      exited = true;
    }
  }

  if (!exited) {
    waitpid(pid, &status, 0);
  }
  // Drain remaining output.
  for (auto &stream : streams) {
    pump(stream, request.max_output_bytes);
    close(stream.fd);
  }

  outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  if (cancelled) {
    return common::Result<CommandOutcome>::failure("Operation has been cancelled",
                                                   common::ErrorCode::OperationCancelled);
  }

  outcome.stdout_text = finish_stream(streams[0]);
  outcome.stderr_text = finish_stream(streams[1]);
  outcome.stdout_truncated = streams[0].truncated;
  outcome.stderr_truncated = streams[1].truncated;
  if (outcome.timed_out) {
    outcome.exit_code = 128 + SIGKILL;
  } else if (WIFEXITED(status)) {
    outcome.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    outcome.exit_code = 128 + WTERMSIG(status);
  }
  return common::Result<CommandOutcome>::success(std::move(outcome));
}

ExecuteCommandTool::ExecuteCommandTool(std::shared_ptr<workspace::WorkspaceRuntime> runtime)
    : runtime_(std::move(runtime)) {}

std::string_view ExecuteCommandTool::description() const {
  return "Execute a shell command inside the workspace sandbox root.";
}

std::string ExecuteCommandTool::parameters_schema() const {
  return R"json({"type":"object","required":["command"],"properties":{"command":{"type":"string","minLength":1,"description":"Command to execute"},"cwd":{"type":"string","description":"Workspace-relative working directory (default: sandbox root)"},"timeout_ms":{"type":"integer","minimum":1,"default":10000},"env":{"type":"object","additionalProperties":{"type":"string"},"description":"Environment variables to pass"},"max_output_kb":{"type":"integer","minimum":1,"default":64}}})json";
}

common::Result<ToolResult> ExecuteCommandTool::execute(const ToolArgs &args,
                                                       const ToolContext &ctx) {
  if (!runtime_) {
    return common::Result<ToolResult>::failure("workspace runtime unavailable",
                                                common::ErrorCode::Config);
  }
  if (const auto active = ctx.check_active(); !active.ok()) {
    return common::Result<ToolResult>::propagate(active);
  }

  auto command = required_arg(args, "command");
  if (!command.ok()) {
    return common::Result<ToolResult>::propagate(command);
  }
  auto timeout_ms = int_arg(args, "timeout_ms", kDefaultTimeoutMs);
  if (!timeout_ms.ok()) {
    return common::Result<ToolResult>::propagate(timeout_ms);
  }
  auto max_output_kb = int_arg(args, "max_output_kb", kDefaultMaxOutputKb);
  if (!max_output_kb.ok()) {
    return common::Result<ToolResult>::propagate(max_output_kb);
  }
  if (timeout_ms.value() <= 0 || max_output_kb.value() <= 0) {
    return common::Result<ToolResult>::failure("timeout_ms and max_output_kb must be positive",
                                                common::ErrorCode::InvalidArgument);
  }
  auto cwd = runtime_->resolve_sandbox_cwd(optional_arg(args, "cwd"));
  if (!cwd.ok()) {
    return common::Result<ToolResult>::propagate(cwd);
  }

  CommandRequest request;
  request.command = command.value();
  request.cwd = cwd.value();
  if (const auto env = optional_arg(args, "env"); env.has_value()) {
    auto parsed = args_from_json(*env);
    if (!parsed.ok()) {
      return common::Result<ToolResult>::failure("Argument env must be an object of strings",
                                                  common::ErrorCode::InvalidArgument);
    }
    request.env.insert(parsed.value().begin(), parsed.value().end());
  }

  auto timeout = std::chrono::milliseconds(timeout_ms.value());
  if (runtime_->operation_timeout().count() > 0) {
    timeout = std::min(timeout, runtime_->operation_timeout());
  }
  if (const auto remaining = ctx.remaining(); remaining.has_value()) {
    timeout = std::min(timeout, *remaining);
  }
  request.timeout = timeout;
  request.max_output_bytes = static_cast<std::size_t>(max_output_kb.value()) * 1024;

  auto outcome = run_command(request, ctx.cancellation);
  if (!outcome.ok()) {
    return common::Result<ToolResult>::propagate(outcome);
  }

  const auto &value = outcome.value();
  std::ostringstream out;
  out << R"({"stdout":)" << json_quote(value.stdout_text) << R"(,"stderr":)"
      << json_quote(value.stderr_text) << R"(,"exitCode":)" << value.exit_code
      << R"(,"durationMs":)" << value.duration.count() << R"(,"timedOut":)"
      << bool_json(value.timed_out) << R"(,"stdoutTruncated":)"
      << bool_json(value.stdout_truncated) << R"(,"stderrTruncated":)"
      << bool_json(value.stderr_truncated) << "}";

  ToolResult result = json_result(out.str());
  result.truncated = value.stdout_truncated || value.stderr_truncated;
  result.metadata["exit_code"] = std::to_string(value.exit_code);
  result.metadata["cwd"] = request.cwd.string();
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace agentfs::tools
