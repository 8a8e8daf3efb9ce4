#include "agentfs/workspace/path_sandbox.hpp"

#include "agentfs/common/fs.hpp"

#include <algorithm>

namespace agentfs::workspace {

namespace {

bool escapes_root(const std::filesystem::path &relative) {
  if (relative.empty() || relative.is_absolute()) {
    return true;
  }
  const auto first = *relative.begin();
  return first == "..";
}

} // namespace

PathSandbox::PathSandbox(std::filesystem::path root) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(root, ec);
  root_ = (ec ? root : absolute).lexically_normal();
  // "/tmp/x/" normalizes to "/tmp/x/" and would break lexically_relative
  if (!root_.has_filename() && root_.has_parent_path() && root_ != root_.root_path()) {
    root_ = root_.parent_path();
  }
}

common::Result<std::string> PathSandbox::normalize(const std::string &raw_path) {
  std::string value = raw_path;
  std::replace(value.begin(), value.end(), '\\', '/');
  if (value.find("..") != std::string::npos || common::starts_with(value, "~")) {
    return common::Result<std::string>::failure("Path traversal not allowed: " + raw_path,
                                                common::ErrorCode::PathTraversal);
  }
  if (!common::starts_with(value, "/")) {
    value.insert(value.begin(), '/');
  }
  return common::Result<std::string>::success(std::move(value));
}

common::Result<std::filesystem::path>
PathSandbox::resolve_to_host(const std::string &workspace_path) const {
  const auto normalized = normalize(workspace_path);
  if (!normalized.ok()) {
    return common::Result<std::filesystem::path>::propagate(normalized);
  }

  const std::string rel = normalized.value().substr(1);
  const std::filesystem::path full = (root_ / rel).lexically_normal();
  std::filesystem::path candidate = full;
  if (!candidate.has_filename() && candidate != candidate.root_path()) {
    candidate = candidate.parent_path();
  }

  if (candidate != root_) {
    if (escapes_root(candidate.lexically_relative(root_))) {
      return common::Result<std::filesystem::path>::failure(
          "Path outside workspace root: " + normalized.value(), common::ErrorCode::PathEscape);
    }
  }
  return common::Result<std::filesystem::path>::success(candidate);
}

common::Result<std::string>
PathSandbox::to_workspace_path(const std::filesystem::path &host_path) const {
  const auto relative = host_path.lexically_normal().lexically_relative(root_);
  if (relative == ".") {
    return common::Result<std::string>::success("/");
  }
  if (escapes_root(relative)) {
    return common::Result<std::string>::failure("Path outside workspace root: " +
                                                    host_path.string(),
                                                common::ErrorCode::PathEscape);
  }
  return common::Result<std::string>::success("/" + relative.generic_string());
}

} // namespace agentfs::workspace
