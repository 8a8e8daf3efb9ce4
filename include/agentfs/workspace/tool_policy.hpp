#pragma once

#include "agentfs/config/schema.hpp"

#include <string>

namespace agentfs::workspace {

/// Resolved policy. An unset `enabled` means the tool is available.
struct ToolPolicy {
  bool enabled = true;
  bool needs_approval = false;
  bool require_read_before_write = false;
};

class ToolPolicyResolver {
public:
  explicit ToolPolicyResolver(config::ToolkitPolicies toolkits);

  /// Toolkit defaults overlaid field by field with the per-tool entry.
  [[nodiscard]] config::ToolPolicyConfig merged(const std::string &toolkit,
                                                const std::string &tool) const;
  [[nodiscard]] ToolPolicy policy_for(const std::string &toolkit, const std::string &tool) const;

private:
  config::ToolkitPolicies toolkits_;
};

} // namespace agentfs::workspace
