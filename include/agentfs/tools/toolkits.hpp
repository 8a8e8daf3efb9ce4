#pragma once

#include "agentfs/search/hybrid_index.hpp"
#include "agentfs/tools/builtin/search.hpp"
#include "agentfs/tools/tool_registry.hpp"
#include "agentfs/workspace/runtime.hpp"

#include <memory>

namespace agentfs::tools {

/// Registers the filesystem tools whose policy leaves them enabled. In
/// read-only mode (or when the runtime is read-only) the mutating tools are
/// left out.
void register_filesystem_toolkit(ToolRegistry &registry,
                                 const std::shared_ptr<workspace::WorkspaceRuntime> &runtime,
                                 bool read_only = false);

void register_sandbox_toolkit(ToolRegistry &registry,
                              const std::shared_ptr<workspace::WorkspaceRuntime> &runtime);

void register_search_toolkit(ToolRegistry &registry,
                             const std::shared_ptr<workspace::WorkspaceRuntime> &runtime,
                             const std::shared_ptr<search::HybridSearchIndex> &index,
                             SearchToolDefaults defaults = {});

/// All three toolkits; search tools only when `index` is set.
[[nodiscard]] ToolRegistry
create_workspace_registry(const std::shared_ptr<workspace::WorkspaceRuntime> &runtime,
                          const std::shared_ptr<search::HybridSearchIndex> &index,
                          SearchToolDefaults defaults = {});

} // namespace agentfs::tools
