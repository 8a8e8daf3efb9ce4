#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace agentfs::search {

struct Snippet {
  std::string text;
  /// 1-indexed, inclusive.
  std::pair<std::size_t, std::size_t> line_range{1, 1};
};

/// Up to two lines of context around the first line containing `query`
/// (case-insensitive, default line 0), cut at `max_length` characters with a
/// trailing "\n..." when cut.
[[nodiscard]] Snippet extract_snippet(const std::string &content, const std::string &query,
                                      std::size_t max_length);

} // namespace agentfs::search
