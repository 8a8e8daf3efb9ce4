#pragma once

#include "agentfs/common/result.hpp"

#include <filesystem>
#include <string>

namespace agentfs::workspace {

/// Maps virtual workspace paths (`/a/b`) onto a host directory.
class PathSandbox {
public:
  explicit PathSandbox(std::filesystem::path root);

  /// Prefixes `/`, converts backslashes and rejects `..` or a leading `~`
  /// with ErrorCode::PathTraversal.
  [[nodiscard]] static common::Result<std::string> normalize(const std::string &raw_path);

  /// Resolves onto the host root, failing with ErrorCode::PathEscape when the
  /// lexically normalized result falls outside the root.
  [[nodiscard]] common::Result<std::filesystem::path>
  resolve_to_host(const std::string &workspace_path) const;

  /// Inverse of resolve_to_host for paths already inside the root.
  [[nodiscard]] common::Result<std::string>
  to_workspace_path(const std::filesystem::path &host_path) const;

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace agentfs::workspace
