#pragma once

#include "agentfs/common/result.hpp"
#include "agentfs/config/schema.hpp"
#include "agentfs/observability/observer.hpp"
#include "agentfs/workspace/filesystem_backend.hpp"
#include "agentfs/workspace/operation_context.hpp"
#include "agentfs/workspace/path_sandbox.hpp"
#include "agentfs/workspace/read_tracker.hpp"
#include "agentfs/workspace/tool_policy.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace agentfs::workspace {

/// Facade over one isolated workspace: path sandboxing for the filesystem
/// and sandbox roots, tool policies, read tracking and the filesystem backend.
class WorkspaceRuntime {
public:
  explicit WorkspaceRuntime(const config::Config &config,
                            std::shared_ptr<observability::IObserver> observer = nullptr,
                            std::shared_ptr<IFilesystemBackend> backend = nullptr);

  /// Creates both roots and seeds `skills/` from the configured seed directory.
  [[nodiscard]] common::Status init();
  void destroy();

  [[nodiscard]] static common::Result<std::string> normalize_path(const std::string &raw_path);
  [[nodiscard]] common::Result<std::filesystem::path>
  resolve_to_host(const std::string &workspace_path) const;
  [[nodiscard]] common::Result<std::filesystem::path>
  resolve_sandbox_cwd(const std::optional<std::string> &workspace_cwd) const;

  [[nodiscard]] ToolPolicy policy(const std::string &toolkit, const std::string &tool) const;
  [[nodiscard]] static std::string operation_key(const OperationContext &ctx);

  /// Stamps the configured operation timeout onto a context without a deadline.
  [[nodiscard]] OperationContext with_deadline(OperationContext ctx) const;

  [[nodiscard]] common::Status record_read(const std::string &operation_key,
                                           const std::string &path);
  /// Version of `path` right now; nullopt when it does not exist.
  [[nodiscard]] common::Result<std::optional<ReadVersion>>
  capture_version(const std::string &path) const;
  [[nodiscard]] common::Status record_read(const std::string &operation_key,
                                           const std::string &path, const ReadVersion &version);
  [[nodiscard]] common::Status assert_read_before_write(const std::string &operation_key,
                                                        const std::string &path);

  [[nodiscard]] IFilesystemBackend &filesystem() { return *backend_; }
  [[nodiscard]] ReadTracker &read_tracker() { return read_tracker_; }
  [[nodiscard]] observability::IObserver &observer() { return *observer_; }
  [[nodiscard]] std::shared_ptr<observability::IObserver> shared_observer() const {
    return observer_;
  }

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] const std::filesystem::path &filesystem_root() const {
    return filesystem_sandbox_.root();
  }
  [[nodiscard]] const std::filesystem::path &sandbox_root() const {
    return command_sandbox_.root();
  }
  [[nodiscard]] std::chrono::milliseconds operation_timeout() const { return operation_timeout_; }
  [[nodiscard]] bool read_only() const { return read_only_; }
  [[nodiscard]] bool initialized() const { return initialized_; }

private:
  [[nodiscard]] std::optional<ReadVersion> probe_version(const std::string &path) const;

  std::string id_;
  PathSandbox filesystem_sandbox_;
  PathSandbox command_sandbox_;
  std::filesystem::path skills_seed_dir_;
  ToolPolicyResolver policies_;
  std::chrono::milliseconds operation_timeout_;
  bool read_only_ = false;
  std::shared_ptr<observability::IObserver> observer_;
  std::shared_ptr<IFilesystemBackend> backend_;
  ReadTracker read_tracker_;
  bool initialized_ = false;
};

} // namespace agentfs::workspace
