#include "agentfs/search/tokenizer.hpp"

#include <cctype>

namespace agentfs::search {

std::vector<std::string> tokenize(const std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  const auto flush = [&] {
    if (current.size() >= kMinTokenLength) {
      tokens.push_back(std::move(current));
    }
    current.clear();
  };

  for (const char raw : text) {
    const char ch = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
      current.push_back(ch);
    } else {
      flush();
    }
  }
  flush();
  return tokens;
}

} // namespace agentfs::search
