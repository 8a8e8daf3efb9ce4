#include "agentfs/workspace/runtime.hpp"

#include "agentfs/common/fs.hpp"
#include "agentfs/observability/noop_observer.hpp"

namespace agentfs::workspace {

namespace {

ReadTrackerOptions tracker_options(const config::ReadTrackerConfig &config) {
  ReadTrackerOptions options;
  options.ttl = std::chrono::seconds(config.ttl_seconds);
  options.max_operations = static_cast<std::size_t>(config.max_operations);
  return options;
}

std::filesystem::path root_or_default(const std::string &value, const std::string &root,
                                      const char *child) {
  if (!value.empty()) {
    return common::expand_path(value);
  }
  return std::filesystem::path(common::expand_path(root)) / child;
}

} // namespace

WorkspaceRuntime::WorkspaceRuntime(const config::Config &config,
                                   std::shared_ptr<observability::IObserver> observer,
                                   std::shared_ptr<IFilesystemBackend> backend)
    : id_(config.workspace.id),
      filesystem_sandbox_(
          root_or_default(config.workspace.filesystem_root, config.workspace.root, "fs")),
      command_sandbox_(
          root_or_default(config.workspace.sandbox_root, config.workspace.root, "sandbox")),
      skills_seed_dir_(config.workspace.skills_seed_dir.empty()
                           ? std::filesystem::path()
                           : std::filesystem::path(
                                 common::expand_path(config.workspace.skills_seed_dir))),
      policies_(config.tools.toolkits),
      operation_timeout_(config.workspace.operation_timeout_ms),
      read_only_(config.workspace.read_only), observer_(std::move(observer)),
      backend_(std::move(backend)),
      read_tracker_([this](const std::string &path) { return probe_version(path); },
                    tracker_options(config.read_tracker)) {
  if (observer_ == nullptr) {
    observer_ = std::make_shared<observability::NoopObserver>();
  }
  if (backend_ == nullptr) {
    backend_ = std::make_shared<LocalFilesystemBackend>(
        filesystem_sandbox_.root(), config.workspace.max_file_size_mb * 1024 * 1024);
  }
}

common::Status WorkspaceRuntime::init() {
  for (const auto &root : {filesystem_sandbox_.root(), command_sandbox_.root()}) {
    if (auto created = common::ensure_dir(root); !created.ok()) {
      return created.status();
    }
  }

  if (!skills_seed_dir_.empty()) {
    std::error_code ec;
    const auto target = filesystem_sandbox_.root() / "skills";
    if (!std::filesystem::exists(target, ec) && std::filesystem::is_directory(skills_seed_dir_, ec)) {
      if (auto copied = common::copy_directory(skills_seed_dir_, target); !copied.ok()) {
        observer_->record_event(observability::ErrorEvent{
            .component = "workspace", .message = "skills seeding failed: " + copied.error()});
        return copied;
      }
    }
  }

  initialized_ = true;
  return common::Status::success();
}

void WorkspaceRuntime::destroy() {
  read_tracker_.clear();
  initialized_ = false;
}

common::Result<std::string> WorkspaceRuntime::normalize_path(const std::string &raw_path) {
  return PathSandbox::normalize(raw_path);
}

common::Result<std::filesystem::path>
WorkspaceRuntime::resolve_to_host(const std::string &workspace_path) const {
  return filesystem_sandbox_.resolve_to_host(workspace_path);
}

common::Result<std::filesystem::path>
WorkspaceRuntime::resolve_sandbox_cwd(const std::optional<std::string> &workspace_cwd) const {
  if (!workspace_cwd.has_value() || common::trim(*workspace_cwd).empty()) {
    return common::Result<std::filesystem::path>::success(command_sandbox_.root());
  }
  return command_sandbox_.resolve_to_host(*workspace_cwd);
}

ToolPolicy WorkspaceRuntime::policy(const std::string &toolkit, const std::string &tool) const {
  return policies_.policy_for(toolkit, tool);
}

std::string WorkspaceRuntime::operation_key(const OperationContext &ctx) {
  return ctx.operation_key();
}

OperationContext WorkspaceRuntime::with_deadline(OperationContext ctx) const {
  if (!ctx.deadline.has_value() && operation_timeout_.count() > 0) {
    ctx.deadline = std::chrono::steady_clock::now() + operation_timeout_;
  }
  return ctx;
}

std::optional<ReadVersion> WorkspaceRuntime::probe_version(const std::string &path) const {
  const auto info = backend_->stat(path);
  if (!info.ok()) {
    return std::nullopt;
  }
  return ReadVersion{.modified_at_nanos = info.value().modified_at_nanos,
                     .size_bytes = static_cast<std::int64_t>(info.value().size)};
}

common::Status WorkspaceRuntime::record_read(const std::string &operation_key,
                                             const std::string &path) {
  const auto normalized = normalize_path(path);
  if (!normalized.ok()) {
    return normalized.status();
  }
  read_tracker_.record_read(operation_key, normalized.value());
  return common::Status::success();
}

common::Result<std::optional<ReadVersion>>
WorkspaceRuntime::capture_version(const std::string &path) const {
  const auto normalized = normalize_path(path);
  if (!normalized.ok()) {
    return common::Result<std::optional<ReadVersion>>::propagate(normalized);
  }
  return common::Result<std::optional<ReadVersion>>::success(
      read_tracker_.capture(normalized.value()));
}

common::Status WorkspaceRuntime::record_read(const std::string &operation_key,
                                             const std::string &path,
                                             const ReadVersion &version) {
  const auto normalized = normalize_path(path);
  if (!normalized.ok()) {
    return normalized.status();
  }
  read_tracker_.record_version(operation_key, normalized.value(), version);
  return common::Status::success();
}

common::Status WorkspaceRuntime::assert_read_before_write(const std::string &operation_key,
                                                          const std::string &path) {
  const auto normalized = normalize_path(path);
  if (!normalized.ok()) {
    return normalized.status();
  }
  return read_tracker_.assert_read_before_write(operation_key, normalized.value());
}

} // namespace agentfs::workspace
