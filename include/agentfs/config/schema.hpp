#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace agentfs::config {

struct WorkspaceConfig {
  std::string id = "agentfs";
  std::string root;
  std::string filesystem_root;
  std::string sandbox_root;
  std::string skills_seed_dir;
  std::uint64_t operation_timeout_ms = 30'000;
  std::uint64_t max_file_size_mb = 25;
  bool read_only = false;
};

struct ReadTrackerConfig {
  std::uint64_t ttl_seconds = 3600;
  std::uint64_t max_operations = 1024;
};

struct SearchConfig {
  std::string embedding_provider = "local";
  std::string embedding_model = "text-embedding-3-small";
  std::size_t embedding_dimensions = 256;
  std::string embedding_base_url = "https://api.openai.com/v1";
  std::optional<std::string> api_key;
  std::string vector_store = "memory";
  std::string db_path;
  std::size_t embedding_cache_size = 10'000;
  std::size_t default_top_k = 5;
  double default_vector_weight = 0.6;
};

/// Partial policy as written in config; unset fields do not override.
struct ToolPolicyConfig {
  std::optional<bool> enabled;
  std::optional<bool> needs_approval;
  std::optional<bool> require_read_before_write;
};

struct ToolkitPolicyConfig {
  ToolPolicyConfig defaults;
  std::unordered_map<std::string, ToolPolicyConfig> tools;
};

using ToolkitPolicies = std::unordered_map<std::string, ToolkitPolicyConfig>;

[[nodiscard]] ToolkitPolicies default_toolkit_policies();

struct ToolsConfig {
  ToolkitPolicies toolkits = default_toolkit_policies();
};

struct ApprovalConfig {
  std::string mode = "policy";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  WorkspaceConfig workspace;
  ReadTrackerConfig read_tracker;
  SearchConfig search;
  ToolsConfig tools;
  ApprovalConfig approval;
  ObservabilityConfig observability;
};

} // namespace agentfs::config
