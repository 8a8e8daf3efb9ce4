#pragma once

#include "agentfs/config/schema.hpp"
#include "agentfs/observability/observer.hpp"
#include "agentfs/search/embedder.hpp"
#include "agentfs/search/hybrid_index.hpp"
#include "agentfs/tools/tool_executor.hpp"
#include "agentfs/workspace/runtime.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentfs::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  /// Host directory backing the workspace filesystem root.
  [[nodiscard]] std::filesystem::path fs_root() const { return path_ / "fs"; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;

private:
  std::filesystem::path path_;
};

/// Config rooted in a temp workspace: local embedder, in-memory vectors, no logging.
config::Config temp_config(const TempWorkspace &workspace);

/// Runtime over `temp_config(workspace)`, already initialized.
std::shared_ptr<workspace::WorkspaceRuntime>
make_runtime(const config::Config &config,
             std::shared_ptr<observability::IObserver> observer = nullptr,
             std::shared_ptr<workspace::IFilesystemBackend> backend = nullptr);

/// Embeds text as counts of a fixed vocabulary, so vector rankings are known
/// in advance. Can be switched into a failing mode.
class FakeEmbedder final : public search::IEmbedder {
public:
  explicit FakeEmbedder(std::vector<std::string> vocabulary);

  [[nodiscard]] std::string_view name() const override { return "fake"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return vocabulary_.size(); }

  void set_failure(std::optional<std::string> message);
  [[nodiscard]] std::size_t calls() const;

private:
  std::vector<std::string> vocabulary_;
  std::optional<std::string> failure_;
  mutable std::mutex mutex_;
  std::size_t calls_ = 0;
};

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  template <typename Event> [[nodiscard]] std::vector<Event> events_of() const {
    std::vector<Event> out;
    for (const auto &event : events()) {
      if (const auto *typed = std::get_if<Event>(&event)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
};

/// Workspace, search index, full tool registry and an executor wired together.
/// Approval defaults to Never so tests exercise tool behavior directly.
class ToolHarness {
public:
  explicit ToolHarness(const std::function<void(config::Config &)> &customize = nullptr,
                       tools::ApprovalMode approval = tools::ApprovalMode::Never);

  ToolHarness(const ToolHarness &) = delete;
  ToolHarness &operator=(const ToolHarness &) = delete;

  tools::ToolCallResult call(const std::string &tool, tools::ToolArgs args,
                             const std::string &operation_id = "op");

  TempWorkspace workspace;
  config::Config config;
  std::shared_ptr<RecordingObserver> observer;
  std::shared_ptr<workspace::WorkspaceRuntime> runtime;
  std::shared_ptr<search::HybridSearchIndex> index;
  tools::ToolRegistry registry;
  std::unique_ptr<tools::ToolExecutor> executor;
};

/// Sets or unsets an environment variable for the guard's lifetime.
struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

} // namespace agentfs::testing
