#pragma once

#include "agentfs/search/hybrid_index.hpp"
#include "agentfs/tools/tool.hpp"
#include "agentfs/workspace/runtime.hpp"

#include <memory>

namespace agentfs::tools {

struct SearchToolDefaults {
  std::size_t top_k = 5;
  double vector_weight = 0.6;
};

class SearchTool : public ITool {
public:
  SearchTool(std::shared_ptr<workspace::WorkspaceRuntime> runtime,
             std::shared_ptr<search::HybridSearchIndex> index);

  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) final;
  [[nodiscard]] std::string_view toolkit() const override { return "search"; }

protected:
  [[nodiscard]] virtual common::Result<ToolResult> run(const ToolArgs &args,
                                                       const ToolContext &ctx) = 0;

  std::shared_ptr<workspace::WorkspaceRuntime> runtime_;
  std::shared_ptr<search::HybridSearchIndex> index_;
};

/// Reads files matching a glob through the filesystem backend and upserts
/// them. Binary and oversized files are skipped.
class WorkspaceIndexTool final : public SearchTool {
public:
  using SearchTool::SearchTool;
  [[nodiscard]] std::string_view name() const override { return "workspace_index"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] bool is_mutating() const override { return true; }

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

class WorkspaceIndexContentTool final : public SearchTool {
public:
  using SearchTool::SearchTool;
  [[nodiscard]] std::string_view name() const override { return "workspace_index_content"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] bool is_mutating() const override { return true; }

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;
};

class WorkspaceSearchTool final : public SearchTool {
public:
  WorkspaceSearchTool(std::shared_ptr<workspace::WorkspaceRuntime> runtime,
                      std::shared_ptr<search::HybridSearchIndex> index,
                      SearchToolDefaults defaults = {});
  [[nodiscard]] std::string_view name() const override { return "workspace_search"; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;

protected:
  [[nodiscard]] common::Result<ToolResult> run(const ToolArgs &args,
                                               const ToolContext &ctx) override;

private:
  SearchToolDefaults defaults_;
};

} // namespace agentfs::tools
