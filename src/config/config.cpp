#include "agentfs/config/config.hpp"

#include "agentfs/common/fs.hpp"
#include "agentfs/common/toml.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace agentfs::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".agentfs";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("AGENTFS_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
        } else {
          out.push_back(ch);
        }
        continue;
      }
      out.push_back(ch == 'n' ? '\n' : ch == 't' ? '\t' : ch);
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!key.empty()) {
      set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
    }
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("AGENTFS_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over cwd .env since the first value set is kept
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }
  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

void overlay_policy(ToolPolicyConfig &target, const common::TomlDocument &doc,
                    const std::string &prefix) {
  if (auto value = doc.get_optional_bool(prefix + ".enabled"); value.has_value()) {
    target.enabled = value;
  }
  if (auto value = doc.get_optional_bool(prefix + ".needs_approval"); value.has_value()) {
    target.needs_approval = value;
  }
  if (auto value = doc.get_optional_bool(prefix + ".require_read_before_write");
      value.has_value()) {
    target.require_read_before_write = value;
  }
}

void load_tool_policies(Config &config, const common::TomlDocument &doc) {
  for (const auto &toolkit : doc.child_names("tools")) {
    auto &entry = config.tools.toolkits[toolkit];
    const std::string base = "tools." + toolkit;
    overlay_policy(entry.defaults, doc, base + ".defaults");
    for (const auto &tool : doc.child_names(base + ".tools")) {
      overlay_policy(entry.tools[tool], doc, base + ".tools." + tool);
    }
  }
}

void load_from_document(Config &config, const common::TomlDocument &doc) {
  auto &ws = config.workspace;
  ws.id = doc.get_string("workspace.id", ws.id);
  ws.root = expand_config_value(doc.get_string("workspace.root", ws.root));
  ws.filesystem_root =
      expand_config_value(doc.get_string("workspace.filesystem_root", ws.filesystem_root));
  ws.sandbox_root = expand_config_value(doc.get_string("workspace.sandbox_root", ws.sandbox_root));
  ws.skills_seed_dir =
      expand_config_value(doc.get_string("workspace.skills_seed_dir", ws.skills_seed_dir));
  ws.operation_timeout_ms = doc.get_u64("workspace.operation_timeout_ms", ws.operation_timeout_ms);
  ws.max_file_size_mb = doc.get_u64("workspace.max_file_size_mb", ws.max_file_size_mb);
  ws.read_only = doc.get_bool("workspace.read_only", ws.read_only);

  config.read_tracker.ttl_seconds =
      doc.get_u64("read_tracker.ttl_seconds", config.read_tracker.ttl_seconds);
  config.read_tracker.max_operations =
      doc.get_u64("read_tracker.max_operations", config.read_tracker.max_operations);

  auto &search = config.search;
  search.embedding_provider = doc.get_string("search.embedding_provider", search.embedding_provider);
  search.embedding_model = doc.get_string("search.embedding_model", search.embedding_model);
  search.embedding_dimensions = static_cast<std::size_t>(
      doc.get_u64("search.embedding_dimensions", search.embedding_dimensions));
  search.embedding_base_url = doc.get_string("search.embedding_base_url", search.embedding_base_url);
  if (doc.has("search.api_key")) {
    search.api_key = expand_config_value(doc.get_string("search.api_key"));
  }
  search.vector_store = doc.get_string("search.vector_store", search.vector_store);
  search.db_path = expand_config_value(doc.get_string("search.db_path", search.db_path));
  search.embedding_cache_size = static_cast<std::size_t>(
      doc.get_u64("search.embedding_cache_size", search.embedding_cache_size));
  search.default_top_k =
      static_cast<std::size_t>(doc.get_u64("search.default_top_k", search.default_top_k));
  search.default_vector_weight =
      doc.get_double("search.default_vector_weight", search.default_vector_weight);

  load_tool_policies(config, doc);

  config.approval.mode = doc.get_string("approval.mode", config.approval.mode);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
}

std::string optional_bool_to_toml(const std::optional<bool> &value) {
  return *value ? "true" : "false";
}

void render_policy(std::ostringstream &out, const std::string &header,
                   const ToolPolicyConfig &policy) {
  if (!policy.enabled.has_value() && !policy.needs_approval.has_value() &&
      !policy.require_read_before_write.has_value()) {
    return;
  }
  out << "\n[" << header << "]\n";
  if (policy.enabled.has_value()) {
    out << "enabled = " << optional_bool_to_toml(policy.enabled) << "\n";
  }
  if (policy.needs_approval.has_value()) {
    out << "needs_approval = " << optional_bool_to_toml(policy.needs_approval) << "\n";
  }
  if (policy.require_read_before_write.has_value()) {
    out << "require_read_before_write = "
        << optional_bool_to_toml(policy.require_read_before_write) << "\n";
  }
}

} // namespace

ToolkitPolicies default_toolkit_policies() {
  ToolkitPolicies policies;
  auto &filesystem = policies["filesystem"];
  filesystem.defaults.needs_approval = false;
  filesystem.tools["delete_file"] =
      ToolPolicyConfig{.needs_approval = true, .require_read_before_write = true};
  filesystem.tools["edit_file"] =
      ToolPolicyConfig{.needs_approval = true, .require_read_before_write = true};
  filesystem.tools["write_file"] = ToolPolicyConfig{.needs_approval = true};
  policies["sandbox"].defaults.needs_approval = true;
  return policies;
}

common::Result<std::filesystem::path> config_dir() {
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::propagate(home);
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::propagate(cfg_dir);
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *root = std::getenv("AGENTFS_WORKSPACE_ROOT"); root != nullptr && *root) {
    config.workspace.root = common::expand_path(root);
  }
  if (const char *provider = std::getenv("AGENTFS_EMBEDDING_PROVIDER");
      provider != nullptr && *provider) {
    config.search.embedding_provider = provider;
  }
  if (const char *api_key = std::getenv("AGENTFS_API_KEY"); api_key != nullptr && *api_key) {
    config.search.api_key = std::string(api_key);
  }
  if (const char *store = std::getenv("AGENTFS_VECTOR_STORE"); store != nullptr && *store) {
    config.search.vector_store = store;
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::propagate(parsed);
  }
  Config config;
  load_from_document(config, parsed.value());
  return common::Result<Config>::success(std::move(config));
}

common::Status resolve_workspace_paths(Config &config) {
  auto &ws = config.workspace;
  if (ws.root.empty()) {
    const auto dir = config_dir();
    if (!dir.ok()) {
      return dir.status();
    }
    ws.root = (dir.value() / "workspace").string();
  }
  const std::filesystem::path root(ws.root);
  if (ws.filesystem_root.empty()) {
    ws.filesystem_root = (root / "fs").string();
  }
  if (ws.sandbox_root.empty()) {
    ws.sandbox_root = (root / "sandbox").string();
  }
  if (config.search.db_path.empty()) {
    config.search.db_path = (root / "search.db").string();
  }
  return common::Status::success();
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::propagate(cfg_path_result);
  }

  Config config;
  const auto &path = cfg_path_result.value();
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    const auto content = common::read_text_file(path);
    if (!content.ok()) {
      return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                             common::ErrorCode::Config);
    }
    auto parsed = parse_config(content.value());
    if (!parsed.ok()) {
      return parsed;
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  if (auto status = resolve_workspace_paths(config); !status.ok()) {
    return common::Result<Config>::failure(status.error(), common::ErrorCode::Config);
  }
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.workspace.id).empty()) {
    return Warnings::failure("workspace.id must not be empty", common::ErrorCode::Config);
  }
  if (config.workspace.operation_timeout_ms == 0) {
    return Warnings::failure("workspace.operation_timeout_ms must be positive",
                             common::ErrorCode::Config);
  }
  if (config.workspace.max_file_size_mb == 0) {
    return Warnings::failure("workspace.max_file_size_mb must be positive",
                             common::ErrorCode::Config);
  }

  const std::string provider = common::to_lower(config.search.embedding_provider);
  if (provider != "local" && provider != "openai" && provider != "noop") {
    return Warnings::failure("Invalid search.embedding_provider: " +
                                 config.search.embedding_provider,
                             common::ErrorCode::Config);
  }
  const std::string store = common::to_lower(config.search.vector_store);
  if (store != "memory" && store != "sqlite") {
    return Warnings::failure("Invalid search.vector_store: " + config.search.vector_store,
                             common::ErrorCode::Config);
  }
  if (config.search.embedding_dimensions == 0) {
    return Warnings::failure("search.embedding_dimensions must be positive",
                             common::ErrorCode::Config);
  }
  if (config.search.default_top_k == 0) {
    return Warnings::failure("search.default_top_k must be positive", common::ErrorCode::Config);
  }
  if (config.search.default_vector_weight < 0.0 || config.search.default_vector_weight > 1.0) {
    return Warnings::failure("search.default_vector_weight must be between 0.0 and 1.0",
                             common::ErrorCode::Config);
  }

  const std::string approval = common::to_lower(config.approval.mode);
  if (approval != "policy" && approval != "always" && approval != "never") {
    return Warnings::failure("Invalid approval.mode: " + config.approval.mode,
                             common::ErrorCode::Config);
  }

  if (provider == "openai" &&
      (!config.search.api_key.has_value() || common::trim(*config.search.api_key).empty())) {
    warnings.push_back("search.embedding_provider is openai but no API key is set "
                       "(search.api_key or AGENTFS_API_KEY)");
  }
  if (store == "sqlite" && config.search.db_path.empty()) {
    warnings.push_back("search.vector_store is sqlite but search.db_path is empty");
  }
  if (config.read_tracker.max_operations == 0 && config.read_tracker.ttl_seconds == 0) {
    warnings.push_back("read tracking is unbounded (ttl_seconds and max_operations are 0)");
  }
  for (const auto &[toolkit, _] : config.tools.toolkits) {
    if (toolkit != "filesystem" && toolkit != "sandbox" && toolkit != "search") {
      warnings.push_back("Unknown toolkit in [tools]: " + toolkit);
    }
  }

  return Warnings::success(std::move(warnings));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[workspace]\n";
  out << "id = " << common::quote_toml_string(config.workspace.id) << "\n";
  out << "root = " << common::quote_toml_string(config.workspace.root) << "\n";
  out << "filesystem_root = " << common::quote_toml_string(config.workspace.filesystem_root)
      << "\n";
  out << "sandbox_root = " << common::quote_toml_string(config.workspace.sandbox_root) << "\n";
  if (!config.workspace.skills_seed_dir.empty()) {
    out << "skills_seed_dir = " << common::quote_toml_string(config.workspace.skills_seed_dir)
        << "\n";
  }
  out << "operation_timeout_ms = " << config.workspace.operation_timeout_ms << "\n";
  out << "max_file_size_mb = " << config.workspace.max_file_size_mb << "\n";
  out << "read_only = " << (config.workspace.read_only ? "true" : "false") << "\n";

  out << "\n[read_tracker]\n";
  out << "ttl_seconds = " << config.read_tracker.ttl_seconds << "\n";
  out << "max_operations = " << config.read_tracker.max_operations << "\n";

  out << "\n[search]\n";
  out << "embedding_provider = " << common::quote_toml_string(config.search.embedding_provider)
      << "\n";
  out << "embedding_model = " << common::quote_toml_string(config.search.embedding_model) << "\n";
  out << "embedding_dimensions = " << config.search.embedding_dimensions << "\n";
  out << "embedding_base_url = " << common::quote_toml_string(config.search.embedding_base_url)
      << "\n";
  if (config.search.api_key.has_value()) {
    // never echo the secret itself
    out << "api_key = \"***\"\n";
  }
  out << "vector_store = " << common::quote_toml_string(config.search.vector_store) << "\n";
  out << "db_path = " << common::quote_toml_string(config.search.db_path) << "\n";
  out << "embedding_cache_size = " << config.search.embedding_cache_size << "\n";
  out << "default_top_k = " << config.search.default_top_k << "\n";
  out << "default_vector_weight = " << config.search.default_vector_weight << "\n";

  std::vector<std::string> toolkits;
  for (const auto &[name, _] : config.tools.toolkits) {
    toolkits.push_back(name);
  }
  std::sort(toolkits.begin(), toolkits.end());
  for (const auto &name : toolkits) {
    const auto &toolkit = config.tools.toolkits.at(name);
    render_policy(out, "tools." + name + ".defaults", toolkit.defaults);
    std::vector<std::string> tools;
    for (const auto &[tool, _] : toolkit.tools) {
      tools.push_back(tool);
    }
    std::sort(tools.begin(), tools.end());
    for (const auto &tool : tools) {
      render_policy(out, "tools." + name + ".tools." + tool, toolkit.tools.at(tool));
    }
  }

  out << "\n[approval]\n";
  out << "mode = " << common::quote_toml_string(config.approval.mode) << "\n";
  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

} // namespace agentfs::config
