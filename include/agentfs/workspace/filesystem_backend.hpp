#pragma once

#include "agentfs/common/result.hpp"
#include "agentfs/workspace/path_sandbox.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentfs::workspace {

struct FileInfo {
  std::string path;
  bool is_dir = false;
  std::uint64_t size = 0;
  std::int64_t modified_at_nanos = 0;
};

struct GrepMatch {
  std::string path;
  std::size_t line = 0;
  std::string text;
};

struct ReadWindow {
  std::size_t offset = 0;
  std::optional<std::size_t> limit;
};

struct EditResult {
  std::size_t occurrences = 0;
};

/// Filesystem operations addressed by workspace paths.
class IFilesystemBackend {
public:
  virtual ~IFilesystemBackend() = default;

  [[nodiscard]] virtual common::Result<std::string> read(const std::string &path,
                                                         const ReadWindow &window = {}) = 0;
  [[nodiscard]] virtual common::Status write(const std::string &path, const std::string &content,
                                             bool create_parent_dirs = true) = 0;
  [[nodiscard]] virtual common::Result<EditResult> edit(const std::string &path,
                                                        const std::string &old_string,
                                                        const std::string &new_string,
                                                        bool replace_all) = 0;
  [[nodiscard]] virtual common::Result<std::vector<FileInfo>> ls_info(const std::string &path) = 0;
  [[nodiscard]] virtual common::Result<std::vector<FileInfo>>
  glob_info(const std::string &pattern, const std::string &path = "/") = 0;
  [[nodiscard]] virtual common::Result<std::vector<GrepMatch>>
  grep_raw(const std::string &pattern, const std::string &path = "/",
           const std::optional<std::string> &glob = std::nullopt) = 0;
  [[nodiscard]] virtual common::Result<FileInfo> stat(const std::string &path) = 0;
  [[nodiscard]] virtual common::Status mkdir(const std::string &path, bool recursive) = 0;
  [[nodiscard]] virtual common::Status remove(const std::string &path, bool recursive) = 0;
};

/// Backend over a host directory; every path goes through a PathSandbox.
class LocalFilesystemBackend final : public IFilesystemBackend {
public:
  LocalFilesystemBackend(std::filesystem::path root, std::uint64_t max_file_size_bytes);

  [[nodiscard]] common::Result<std::string> read(const std::string &path,
                                                 const ReadWindow &window = {}) override;
  [[nodiscard]] common::Status write(const std::string &path, const std::string &content,
                                     bool create_parent_dirs = true) override;
  [[nodiscard]] common::Result<EditResult> edit(const std::string &path,
                                                const std::string &old_string,
                                                const std::string &new_string,
                                                bool replace_all) override;
  [[nodiscard]] common::Result<std::vector<FileInfo>> ls_info(const std::string &path) override;
  [[nodiscard]] common::Result<std::vector<FileInfo>>
  glob_info(const std::string &pattern, const std::string &path = "/") override;
  [[nodiscard]] common::Result<std::vector<GrepMatch>>
  grep_raw(const std::string &pattern, const std::string &path = "/",
           const std::optional<std::string> &glob = std::nullopt) override;
  [[nodiscard]] common::Result<FileInfo> stat(const std::string &path) override;
  [[nodiscard]] common::Status mkdir(const std::string &path, bool recursive) override;
  [[nodiscard]] common::Status remove(const std::string &path, bool recursive) override;

  [[nodiscard]] const PathSandbox &sandbox() const { return sandbox_; }

private:
  [[nodiscard]] common::Result<std::string> read_whole(const std::filesystem::path &host_path,
                                                       const std::string &path) const;
  [[nodiscard]] common::Result<FileInfo> info_for(const std::filesystem::path &host_path) const;

  PathSandbox sandbox_;
  std::uint64_t max_file_size_bytes_;
};

/// Glob matching on `/`-separated relative paths: `*`, `?`, `**` and `{a,b}`.
[[nodiscard]] bool glob_match(const std::string &pattern, const std::string &relative_path);

/// Nanosecond count of a file time, stable for comparing versions of one file.
[[nodiscard]] std::int64_t to_nanos(std::filesystem::file_time_type time);

} // namespace agentfs::workspace
