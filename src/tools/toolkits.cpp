#include "agentfs/tools/toolkits.hpp"

#include "agentfs/tools/builtin/filesystem.hpp"
#include "agentfs/tools/builtin/sandbox.hpp"

#include <vector>

namespace agentfs::tools {

namespace {

void register_if_enabled(ToolRegistry &registry, const workspace::WorkspaceRuntime &runtime,
                         std::unique_ptr<ITool> tool, const bool hide_mutating = false) {
  if (hide_mutating && tool->is_mutating()) {
    return;
  }
  if (!runtime.policy(std::string(tool->toolkit()), std::string(tool->name())).enabled) {
    return;
  }
  registry.register_tool(std::move(tool));
}

} // namespace

void register_filesystem_toolkit(ToolRegistry &registry,
                                 const std::shared_ptr<workspace::WorkspaceRuntime> &runtime,
                                 const bool read_only) {
  const bool hide = read_only || runtime->read_only();
  std::vector<std::unique_ptr<ITool>> tools;
  tools.push_back(std::make_unique<LsTool>(runtime));
  tools.push_back(std::make_unique<ReadFileTool>(runtime));
  tools.push_back(std::make_unique<GlobTool>(runtime));
  tools.push_back(std::make_unique<GrepTool>(runtime));
  tools.push_back(std::make_unique<StatTool>(runtime));
  tools.push_back(std::make_unique<ListTreeTool>(runtime, "list_tree"));
  tools.push_back(std::make_unique<ListTreeTool>(runtime, "list_files"));
  tools.push_back(std::make_unique<MkdirTool>(runtime));
  tools.push_back(std::make_unique<RmdirTool>(runtime));
  tools.push_back(std::make_unique<DeleteFileTool>(runtime));
  tools.push_back(std::make_unique<WriteFileTool>(runtime));
  tools.push_back(std::make_unique<EditFileTool>(runtime));
  for (auto &tool : tools) {
    register_if_enabled(registry, *runtime, std::move(tool), hide);
  }
}

void register_sandbox_toolkit(ToolRegistry &registry,
                              const std::shared_ptr<workspace::WorkspaceRuntime> &runtime) {
  register_if_enabled(registry, *runtime, std::make_unique<ExecuteCommandTool>(runtime));
}

void register_search_toolkit(ToolRegistry &registry,
                             const std::shared_ptr<workspace::WorkspaceRuntime> &runtime,
                             const std::shared_ptr<search::HybridSearchIndex> &index,
                             const SearchToolDefaults defaults) {
  register_if_enabled(registry, *runtime, std::make_unique<WorkspaceIndexTool>(runtime, index));
  register_if_enabled(registry, *runtime,
                      std::make_unique<WorkspaceIndexContentTool>(runtime, index));
  register_if_enabled(registry, *runtime,
                      std::make_unique<WorkspaceSearchTool>(runtime, index, defaults));
}

ToolRegistry create_workspace_registry(const std::shared_ptr<workspace::WorkspaceRuntime> &runtime,
                                       const std::shared_ptr<search::HybridSearchIndex> &index,
                                       const SearchToolDefaults defaults) {
  ToolRegistry registry;
  register_filesystem_toolkit(registry, runtime);
  register_sandbox_toolkit(registry, runtime);
  if (index) {
    register_search_toolkit(registry, runtime, index, defaults);
  }
  return registry;
}

} // namespace agentfs::tools
