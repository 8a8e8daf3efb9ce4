#include "agentfs/workspace/tool_policy.hpp"

namespace agentfs::workspace {

namespace {

void overlay(config::ToolPolicyConfig &target, const config::ToolPolicyConfig &source) {
  if (source.enabled.has_value()) {
    target.enabled = source.enabled;
  }
  if (source.needs_approval.has_value()) {
    target.needs_approval = source.needs_approval;
  }
  if (source.require_read_before_write.has_value()) {
    target.require_read_before_write = source.require_read_before_write;
  }
}

} // namespace

ToolPolicyResolver::ToolPolicyResolver(config::ToolkitPolicies toolkits)
    : toolkits_(std::move(toolkits)) {}

config::ToolPolicyConfig ToolPolicyResolver::merged(const std::string &toolkit,
                                                    const std::string &tool) const {
  config::ToolPolicyConfig result;
  const auto it = toolkits_.find(toolkit);
  if (it == toolkits_.end()) {
    return result;
  }
  overlay(result, it->second.defaults);
  if (const auto tool_it = it->second.tools.find(tool); tool_it != it->second.tools.end()) {
    overlay(result, tool_it->second);
  }
  return result;
}

ToolPolicy ToolPolicyResolver::policy_for(const std::string &toolkit,
                                          const std::string &tool) const {
  const auto partial = merged(toolkit, tool);
  return ToolPolicy{
      .enabled = partial.enabled.value_or(true),
      .needs_approval = partial.needs_approval.value_or(false),
      .require_read_before_write = partial.require_read_before_write.value_or(false),
  };
}

} // namespace agentfs::workspace
