#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace agentfs::search {

inline constexpr std::size_t kMinTokenLength = 2;

/// Lowercases and splits on runs of non `[a-z0-9]` bytes, dropping tokens
/// shorter than kMinTokenLength.
[[nodiscard]] std::vector<std::string> tokenize(std::string_view text);

} // namespace agentfs::search
