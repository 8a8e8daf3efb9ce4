#include "agentfs/tools/tool_registry.hpp"

#include "agentfs/common/fs.hpp"

#include <algorithm>

namespace agentfs::tools {

void ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
  ITool *raw = tool.get();
  const std::string key = common::to_lower(std::string(raw->name()));
  if (const auto existing = by_name_.find(key); existing != by_name_.end()) {
    const ITool *old = existing->second;
    tools_.erase(std::remove_if(tools_.begin(), tools_.end(),
                                [old](const auto &candidate) { return candidate.get() == old; }),
                 tools_.end());
  }
  by_name_[key] = raw;
  tools_.push_back(std::move(tool));
}

ITool *ToolRegistry::get_tool(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec());
  }
  return specs;
}

std::vector<ITool *> ToolRegistry::all_tools() const {
  std::vector<ITool *> out;
  out.reserve(tools_.size());
  for (const auto &tool : tools_) {
    out.push_back(tool.get());
  }
  return out;
}

} // namespace agentfs::tools
