#pragma once

#include "agentfs/tools/tool.hpp"

#include <memory>
#include <unordered_map>
#include <vector>

namespace agentfs::tools {

class ToolRegistry {
public:
  ToolRegistry() = default;

  /// Replaces any tool already registered under the same name.
  void register_tool(std::unique_ptr<ITool> tool);
  [[nodiscard]] ITool *get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;
  [[nodiscard]] std::vector<ITool *> all_tools() const;
  [[nodiscard]] std::size_t size() const { return tools_.size(); }

private:
  std::vector<std::unique_ptr<ITool>> tools_;
  std::unordered_map<std::string, ITool *> by_name_;
};

} // namespace agentfs::tools
