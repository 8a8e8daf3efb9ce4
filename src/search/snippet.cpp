#include "agentfs/search/snippet.hpp"

#include "agentfs/common/fs.hpp"

#include <algorithm>

namespace agentfs::search {

namespace {

constexpr std::size_t kContextLines = 2;

} // namespace

Snippet extract_snippet(const std::string &content, const std::string &query,
                        const std::size_t max_length) {
  auto lines = common::split_lines(content);
  if (lines.empty()) {
    lines.emplace_back();
  }
  const std::string needle = common::to_lower(common::trim(query));

  std::size_t best = 0;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (common::to_lower(lines[i]).find(needle) != std::string::npos) {
      best = i;
      break;
    }
  }

  const std::size_t start = best >= kContextLines ? best - kContextLines : 0;
  const std::size_t end = std::min(lines.size() - 1, best + kContextLines);
  std::string combined;
  for (std::size_t i = start; i <= end; ++i) {
    if (i > start) {
      combined.push_back('\n');
    }
    combined += lines[i];
  }
  if (combined.size() > max_length) {
    // never split a UTF-8 sequence
    std::size_t cut = max_length;
    while (cut > 0 && (static_cast<unsigned char>(combined[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    combined = combined.substr(0, cut) + "\n...";
  }
  return Snippet{.text = std::move(combined), .line_range = {start + 1, end + 1}};
}

} // namespace agentfs::search
