#include "agentfs/search/lexical_index.hpp"

#include "agentfs/search/tokenizer.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace agentfs::search {

Bm25Index::Bm25Index(const Bm25Parameters params) : params_(params) {}

void Bm25Index::adjust_document_frequency(const std::string &content, const int delta) {
  const auto tokens = tokenize(content);
  const std::unordered_set<std::string> unique(tokens.begin(), tokens.end());
  for (const auto &term : unique) {
    if (delta > 0) {
      ++document_frequency_[term];
      continue;
    }
    const auto it = document_frequency_.find(term);
    if (it == document_frequency_.end()) {
      continue;
    }
    if (it->second <= 1) {
      document_frequency_.erase(it);
    } else {
      --it->second;
    }
  }
}

void Bm25Index::upsert(const std::string &path, const std::string &content) {
  if (const auto previous = contents_.find(path); previous != contents_.end()) {
    adjust_document_frequency(previous->second, -1);
    total_length_ -= lengths_[path];
  }

  const std::size_t length = tokenize(content).size();
  adjust_document_frequency(content, +1);
  contents_[path] = content;
  lengths_[path] = length;
  total_length_ += length;
  average_length_ =
      lengths_.empty() ? 0.0 : static_cast<double>(total_length_) / static_cast<double>(lengths_.size());
}

std::vector<ScoredPath> Bm25Index::score(const std::vector<std::string> &query_tokens) const {
  std::vector<ScoredPath> results;
  const auto n = static_cast<double>(contents_.size());
  if (contents_.empty() || query_tokens.empty()) {
    return results;
  }
  const double avg = average_length_ > 0.0 ? average_length_ : 1.0;

  for (const auto &[path, content] : contents_) {
    const auto tokens = tokenize(content);
    std::unordered_map<std::string, std::size_t> tf;
    for (const auto &token : tokens) {
      ++tf[token];
    }
    const auto dl = static_cast<double>(tokens.size());

    double total = 0.0;
    for (const auto &term : query_tokens) {
      const auto f_it = tf.find(term);
      if (f_it == tf.end()) {
        continue;
      }
      const auto f = static_cast<double>(f_it->second);
      const auto df = static_cast<double>(document_frequency(term));
      const double idf = std::log(1.0 + (n - df + 0.5) / (df + 0.5));
      const double denom = f + params_.k1 * (1.0 - params_.b + params_.b * dl / avg);
      total += idf * (f * (params_.k1 + 1.0)) / denom;
    }
    if (total > 0.0) {
      results.push_back(ScoredPath{.path = path, .score = total});
    }
  }

  std::sort(results.begin(), results.end(), [](const ScoredPath &lhs, const ScoredPath &rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.path < rhs.path;
  });
  return results;
}

std::size_t Bm25Index::document_frequency(const std::string &term) const {
  const auto it = document_frequency_.find(term);
  return it == document_frequency_.end() ? 0 : it->second;
}

} // namespace agentfs::search
