#pragma once

#include "agentfs/common/result.hpp"
#include "agentfs/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentfs::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Loads the config file (if any), applies `.env` files and env overrides and
/// fills in derived workspace paths.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);

/// Fills empty root/filesystem_root/sandbox_root/db_path from their parents.
[[nodiscard]] common::Status resolve_workspace_paths(Config &config);

/// Returns soft warnings on success, an error for invalid values.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

[[nodiscard]] std::string render_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace agentfs::config
