#pragma once

#include "agentfs/common/result.hpp"
#include "agentfs/search/embedder.hpp"
#include "agentfs/search/lexical_index.hpp"
#include "agentfs/search/vector_store.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentfs::search {

enum class SearchMode { Bm25, Vector, Hybrid };

[[nodiscard]] std::string search_mode_to_string(SearchMode mode);
[[nodiscard]] std::optional<SearchMode> search_mode_from_string(const std::string &value);

struct IndexedDocument {
  std::string path;
  std::string content;
  std::string source = "filesystem";
};

struct SearchOptions {
  SearchMode mode = SearchMode::Hybrid;
  std::size_t top_k = 5;
  double vector_weight = 0.6;
  double min_score = 0.0;
};

struct SearchHit {
  std::string path;
  double score = 0.0;
  std::optional<double> bm25_score;
  std::optional<double> vector_score;
};

/// Min-max normalizes scores into [0, 1]; every score becomes 1 when the
/// range is zero.
void normalize_scores(std::vector<ScoredPath> &results);

/// BM25 blended with vector similarity. Lexical state is guarded by a
/// reader/writer lock; the embedder and vector store are called outside it.
class HybridSearchIndex {
public:
  HybridSearchIndex(std::shared_ptr<IEmbedder> embedder, std::shared_ptr<IVectorStore> vectors,
                    std::unique_ptr<ILexicalIndex> lexical = std::make_unique<Bm25Index>());

  /// Embeds and stores the vector first; lexical state changes only when
  /// that succeeded.
  [[nodiscard]] common::Status upsert(const IndexedDocument &document);
  [[nodiscard]] common::Result<std::vector<SearchHit>> search(const std::string &query,
                                                              const SearchOptions &options) const;

  [[nodiscard]] std::optional<IndexedDocument> get(const std::string &path) const;
  [[nodiscard]] std::vector<IndexedDocument> list() const;
  [[nodiscard]] std::size_t size() const;

private:
  [[nodiscard]] std::vector<ScoredPath> search_bm25(const std::string &query) const;
  [[nodiscard]] common::Result<std::vector<ScoredPath>> search_vector(const std::string &query,
                                                                      std::size_t top_k) const;

  std::shared_ptr<IEmbedder> embedder_;
  std::shared_ptr<IVectorStore> vectors_;
  std::unique_ptr<ILexicalIndex> lexical_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, IndexedDocument> documents_;
};

} // namespace agentfs::search
