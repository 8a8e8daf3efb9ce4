#include "agentfs/workspace/filesystem_backend.hpp"

#include "agentfs/common/fs.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <regex>
#include <sstream>

namespace agentfs::workspace {

namespace {

constexpr std::size_t kMaxGrepMatches = 1000;

std::string glob_to_regex(const std::string &pattern) {
  std::string out;
  out.reserve(pattern.size() * 2);
  bool in_brace = false;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const char ch = pattern[i];
    switch (ch) {
    case '*':
      if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
        ++i;
        if (i + 1 < pattern.size() && pattern[i + 1] == '/') {
          ++i;
          out += "(?:.*/)?";
        } else {
          out += ".*";
        }
      } else {
        out += "[^/]*";
      }
      break;
    case '?':
      out += "[^/]";
      break;
    case '{':
      in_brace = true;
      out += "(?:";
      break;
    case '}':
      out += in_brace ? ")" : "\\}";
      in_brace = false;
      break;
    case ',':
      out += in_brace ? "|" : ",";
      break;
    case '.':
    case '+':
    case '(':
    case ')':
    case '^':
    case '$':
    case '|':
    case '[':
    case ']':
    case '\\':
      out.push_back('\\');
      out.push_back(ch);
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

bool is_binary_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::array<char, 8192> buffer{};
  in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  const auto count = in.gcount();
  for (std::streamsize i = 0; i < count; ++i) {
    if (buffer[static_cast<std::size_t>(i)] == '\0') {
      return true;
    }
  }
  return false;
}

common::Status write_atomically(const std::filesystem::path &target, const std::string &content) {
  const auto temp_path = target.string() + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return common::Status::error("Failed to write temporary file for " + target.string());
    }
    out << content;
    if (!out) {
      return common::Status::error("Failed writing " + target.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(temp_path, target, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return common::Status::error("Failed to replace file: " + target.string());
  }
  return common::Status::success();
}

std::string join_window(const std::vector<std::string> &lines, const ReadWindow &window) {
  std::ostringstream out;
  const std::size_t end =
      window.limit.has_value() ? std::min(lines.size(), window.offset + *window.limit) : lines.size();
  for (std::size_t i = window.offset; i < end; ++i) {
    if (i > window.offset) {
      out << '\n';
    }
    out << lines[i];
  }
  return out.str();
}

} // namespace

bool glob_match(const std::string &pattern, const std::string &relative_path) {
  try {
    return std::regex_match(relative_path, std::regex(glob_to_regex(pattern)));
  } catch (const std::regex_error &) {
    return false;
  }
}

std::int64_t to_nanos(const std::filesystem::file_time_type time) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
}

LocalFilesystemBackend::LocalFilesystemBackend(std::filesystem::path root,
                                               const std::uint64_t max_file_size_bytes)
    : sandbox_(std::move(root)), max_file_size_bytes_(max_file_size_bytes) {}

common::Result<FileInfo> LocalFilesystemBackend::info_for(const std::filesystem::path &host_path) const {
  std::error_code ec;
  const auto status = std::filesystem::status(host_path, ec);
  if (ec || !std::filesystem::exists(status)) {
    return common::Result<FileInfo>::failure("Path not found", common::ErrorCode::NotFound);
  }
  auto virtual_path = sandbox_.to_workspace_path(host_path);
  if (!virtual_path.ok()) {
    return common::Result<FileInfo>::propagate(virtual_path);
  }

  FileInfo info;
  info.path = virtual_path.value();
  info.is_dir = std::filesystem::is_directory(status);
  if (!info.is_dir) {
    info.size = std::filesystem::file_size(host_path, ec);
    if (ec) {
      info.size = 0;
    }
  }
  const auto modified = std::filesystem::last_write_time(host_path, ec);
  if (!ec) {
    info.modified_at_nanos = to_nanos(modified);
  }
  return common::Result<FileInfo>::success(std::move(info));
}

common::Result<std::string>
LocalFilesystemBackend::read_whole(const std::filesystem::path &host_path,
                                   const std::string &path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(host_path, ec)) {
    return common::Result<std::string>::failure("File not found: " + path,
                                                common::ErrorCode::NotFound);
  }
  const auto size = std::filesystem::file_size(host_path, ec);
  if (ec) {
    return common::Result<std::string>::failure("Unable to stat file: " + path);
  }
  if (max_file_size_bytes_ > 0 && size > max_file_size_bytes_) {
    return common::Result<std::string>::failure(
        "File exceeds maximum size of " + std::to_string(max_file_size_bytes_ / (1024 * 1024)) +
            " MB: " + path,
        common::ErrorCode::InvalidArgument);
  }
  if (is_binary_file(host_path)) {
    return common::Result<std::string>::failure("Binary file read is not allowed: " + path,
                                                common::ErrorCode::InvalidArgument);
  }
  auto content = common::read_text_file(host_path);
  if (!content.ok()) {
    return common::Result<std::string>::failure("Failed to open file: " + path, content.code());
  }
  return content;
}

common::Result<std::string> LocalFilesystemBackend::read(const std::string &path,
                                                         const ReadWindow &window) {
  const auto host = sandbox_.resolve_to_host(path);
  if (!host.ok()) {
    return common::Result<std::string>::propagate(host);
  }
  auto content = read_whole(host.value(), path);
  if (!content.ok() || (window.offset == 0 && !window.limit.has_value())) {
    return content;
  }
  return common::Result<std::string>::success(
      join_window(common::split_lines(content.value()), window));
}

common::Status LocalFilesystemBackend::write(const std::string &path, const std::string &content,
                                             const bool create_parent_dirs) {
  const auto host = sandbox_.resolve_to_host(path);
  if (!host.ok()) {
    return host.status();
  }
  std::error_code ec;
  if (std::filesystem::is_directory(host.value(), ec)) {
    return common::Status::error("Path is a directory: " + path,
                                 common::ErrorCode::InvalidArgument);
  }
  const auto parent = host.value().parent_path();
  if (create_parent_dirs) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return common::Status::error("Failed to create parent directories: " + ec.message());
    }
  } else if (!std::filesystem::is_directory(parent, ec)) {
    return common::Status::error("Parent directory does not exist: " + path,
                                 common::ErrorCode::NotFound);
  }
  return write_atomically(host.value(), content);
}

common::Result<EditResult> LocalFilesystemBackend::edit(const std::string &path,
                                                        const std::string &old_string,
                                                        const std::string &new_string,
                                                        const bool replace_all) {
  if (old_string.empty()) {
    return common::Result<EditResult>::failure("old_string must not be empty",
                                               common::ErrorCode::InvalidArgument);
  }
  const auto host = sandbox_.resolve_to_host(path);
  if (!host.ok()) {
    return common::Result<EditResult>::propagate(host);
  }
  auto content_result = read_whole(host.value(), path);
  if (!content_result.ok()) {
    return common::Result<EditResult>::propagate(content_result);
  }
  std::string content = std::move(content_result.value());

  std::size_t occurrences = 0;
  for (auto pos = content.find(old_string); pos != std::string::npos;
       pos = content.find(old_string, pos + old_string.size())) {
    ++occurrences;
  }
  if (occurrences == 0) {
    return common::Result<EditResult>::failure("old_string not found in " + path,
                                               common::ErrorCode::InvalidArgument);
  }
  if (occurrences > 1 && !replace_all) {
    return common::Result<EditResult>::failure(
        "old_string must be unique in " + path + " (found " + std::to_string(occurrences) +
            "); pass replace_all to replace every occurrence",
        common::ErrorCode::InvalidArgument);
  }

  std::string updated;
  updated.reserve(content.size());
  std::size_t cursor = 0;
  for (auto pos = content.find(old_string); pos != std::string::npos;
       pos = content.find(old_string, cursor)) {
    updated.append(content, cursor, pos - cursor);
    updated += new_string;
    cursor = pos + old_string.size();
  }
  updated.append(content, cursor, std::string::npos);

  if (auto status = write_atomically(host.value(), updated); !status.ok()) {
    return common::Result<EditResult>::propagate(status);
  }
  return common::Result<EditResult>::success(EditResult{.occurrences = occurrences});
}

common::Result<std::vector<FileInfo>> LocalFilesystemBackend::ls_info(const std::string &path) {
  const auto host = sandbox_.resolve_to_host(path);
  if (!host.ok()) {
    return common::Result<std::vector<FileInfo>>::propagate(host);
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(host.value(), ec)) {
    return common::Result<std::vector<FileInfo>>::failure("Directory not found: " + path,
                                                          common::ErrorCode::NotFound);
  }

  std::vector<FileInfo> entries;
  for (const auto &entry : std::filesystem::directory_iterator(host.value(), ec)) {
    auto info = info_for(entry.path());
    if (info.ok()) {
      entries.push_back(std::move(info.value()));
    }
  }
  if (ec) {
    return common::Result<std::vector<FileInfo>>::failure("Failed to list " + path + ": " +
                                                          ec.message());
  }
  std::sort(entries.begin(), entries.end(),
            [](const FileInfo &lhs, const FileInfo &rhs) { return lhs.path < rhs.path; });
  return common::Result<std::vector<FileInfo>>::success(std::move(entries));
}

common::Result<std::vector<FileInfo>> LocalFilesystemBackend::glob_info(const std::string &pattern,
                                                                         const std::string &path) {
  const auto host = sandbox_.resolve_to_host(path.empty() ? "/" : path);
  if (!host.ok()) {
    return common::Result<std::vector<FileInfo>>::propagate(host);
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(host.value(), ec)) {
    return common::Result<std::vector<FileInfo>>::failure("Directory not found: " + path,
                                                          common::ErrorCode::NotFound);
  }

  std::regex matcher;
  try {
    matcher = std::regex(glob_to_regex(pattern.empty() ? "**/*" : pattern));
  } catch (const std::regex_error &err) {
    return common::Result<std::vector<FileInfo>>::failure(
        "Invalid glob pattern: " + pattern + " (" + err.what() + ")",
        common::ErrorCode::InvalidArgument);
  }

  std::vector<FileInfo> matches;
  const auto options = std::filesystem::directory_options::skip_permission_denied;
  for (std::filesystem::recursive_directory_iterator it(host.value(), options, ec), end;
       !ec && it != end; it.increment(ec)) {
    const std::string relative = it->path().lexically_relative(host.value()).generic_string();
    if (!std::regex_match(relative, matcher)) {
      continue;
    }
    auto info = info_for(it->path());
    if (info.ok()) {
      matches.push_back(std::move(info.value()));
    }
  }
  if (ec) {
    return common::Result<std::vector<FileInfo>>::failure("Failed to walk " + path + ": " +
                                                          ec.message());
  }
  std::sort(matches.begin(), matches.end(),
            [](const FileInfo &lhs, const FileInfo &rhs) { return lhs.path < rhs.path; });
  return common::Result<std::vector<FileInfo>>::success(std::move(matches));
}

common::Result<std::vector<GrepMatch>>
LocalFilesystemBackend::grep_raw(const std::string &pattern, const std::string &path,
                                 const std::optional<std::string> &glob) {
  std::regex matcher;
  try {
    matcher = std::regex(pattern);
  } catch (const std::regex_error &err) {
    return common::Result<std::vector<GrepMatch>>::failure(
        "Invalid regex: " + pattern + " (" + err.what() + ")", common::ErrorCode::InvalidArgument);
  }

  auto files = glob_info(glob.value_or("**/*"), path);
  if (!files.ok()) {
    return common::Result<std::vector<GrepMatch>>::propagate(files);
  }

  std::vector<GrepMatch> matches;
  for (const auto &file : files.value()) {
    if (file.is_dir) {
      continue;
    }
    const auto host = sandbox_.resolve_to_host(file.path);
    if (!host.ok()) {
      continue;
    }
    // binary or oversized files are not searchable
    auto content = read_whole(host.value(), file.path);
    if (!content.ok()) {
      continue;
    }
    const auto lines = common::split_lines(content.value());
    for (std::size_t i = 0; i < lines.size(); ++i) {
      if (std::regex_search(lines[i], matcher)) {
        matches.push_back(GrepMatch{.path = file.path, .line = i + 1, .text = lines[i]});
        if (matches.size() >= kMaxGrepMatches) {
          return common::Result<std::vector<GrepMatch>>::success(std::move(matches));
        }
      }
    }
  }
  return common::Result<std::vector<GrepMatch>>::success(std::move(matches));
}

common::Result<FileInfo> LocalFilesystemBackend::stat(const std::string &path) {
  const auto host = sandbox_.resolve_to_host(path);
  if (!host.ok()) {
    return common::Result<FileInfo>::propagate(host);
  }
  auto info = info_for(host.value());
  if (!info.ok()) {
    return common::Result<FileInfo>::failure("Path not found: " + path, info.code());
  }
  return info;
}

common::Status LocalFilesystemBackend::mkdir(const std::string &path, const bool recursive) {
  const auto host = sandbox_.resolve_to_host(path);
  if (!host.ok()) {
    return host.status();
  }
  std::error_code ec;
  if (recursive) {
    std::filesystem::create_directories(host.value(), ec);
  } else {
    std::filesystem::create_directory(host.value(), ec);
  }
  if (ec) {
    return common::Status::error("Failed to create directory " + path + ": " + ec.message());
  }
  return common::Status::success();
}

common::Status LocalFilesystemBackend::remove(const std::string &path, const bool recursive) {
  const auto host = sandbox_.resolve_to_host(path);
  if (!host.ok()) {
    return host.status();
  }
  if (host.value() == sandbox_.root()) {
    return common::Status::error("Refusing to remove the workspace root",
                                 common::ErrorCode::InvalidArgument);
  }
  std::error_code ec;
  const auto status = std::filesystem::symlink_status(host.value(), ec);
  if (ec || !std::filesystem::exists(status)) {
    return common::Status::error("Path not found: " + path, common::ErrorCode::NotFound);
  }
  if (std::filesystem::is_directory(status) && recursive) {
    std::filesystem::remove_all(host.value(), ec);
  } else {
    std::filesystem::remove(host.value(), ec);
  }
  if (ec) {
    return common::Status::error("Failed to remove " + path + ": " + ec.message());
  }
  return common::Status::success();
}

} // namespace agentfs::workspace
