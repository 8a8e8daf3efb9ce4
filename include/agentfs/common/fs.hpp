#pragma once

#include "agentfs/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace agentfs::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);
[[nodiscard]] Status copy_directory(const std::filesystem::path &from,
                                    const std::filesystem::path &to);

} // namespace agentfs::common
