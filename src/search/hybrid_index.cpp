#include "agentfs/search/hybrid_index.hpp"

#include "agentfs/common/fs.hpp"
#include "agentfs/search/tokenizer.hpp"

#include <algorithm>
#include <limits>
#include <mutex>

namespace agentfs::search {

std::string search_mode_to_string(const SearchMode mode) {
  switch (mode) {
  case SearchMode::Bm25:
    return "bm25";
  case SearchMode::Vector:
    return "vector";
  case SearchMode::Hybrid:
    return "hybrid";
  }
  return "hybrid";
}

std::optional<SearchMode> search_mode_from_string(const std::string &value) {
  const std::string mode = common::to_lower(common::trim(value));
  if (mode == "bm25") {
    return SearchMode::Bm25;
  }
  if (mode == "vector") {
    return SearchMode::Vector;
  }
  if (mode == "hybrid") {
    return SearchMode::Hybrid;
  }
  return std::nullopt;
}

void normalize_scores(std::vector<ScoredPath> &results) {
  if (results.empty()) {
    return;
  }
  const auto [min_it, max_it] = std::minmax_element(
      results.begin(), results.end(),
      [](const ScoredPath &lhs, const ScoredPath &rhs) { return lhs.score < rhs.score; });
  const double min = min_it->score;
  const double range = max_it->score - min;
  for (auto &result : results) {
    result.score = range <= 0.0 ? 1.0 : (result.score - min) / range;
  }
}

HybridSearchIndex::HybridSearchIndex(std::shared_ptr<IEmbedder> embedder,
                                     std::shared_ptr<IVectorStore> vectors,
                                     std::unique_ptr<ILexicalIndex> lexical)
    : embedder_(std::move(embedder)), vectors_(std::move(vectors)), lexical_(std::move(lexical)) {}

common::Status HybridSearchIndex::upsert(const IndexedDocument &document) {
  auto embedding = embedder_->embed(document.content);
  if (!embedding.ok()) {
    return common::Status::error("Failed to embed " + document.path + ": " + embedding.error(),
                                 embedding.code() == common::ErrorCode::Io
                                     ? common::ErrorCode::Embedding
                                     : embedding.code());
  }
  if (auto stored = vectors_->store(document.path, embedding.value(),
                                    {{"path", document.path}, {"source", document.source}});
      !stored.ok()) {
    return stored;
  }

  std::unique_lock lock(mutex_);
  lexical_->upsert(document.path, document.content);
  documents_[document.path] = document;
  return common::Status::success();
}

std::vector<ScoredPath> HybridSearchIndex::search_bm25(const std::string &query) const {
  const auto tokens = tokenize(query);
  std::vector<ScoredPath> results;
  {
    std::shared_lock lock(mutex_);
    results = lexical_->score(tokens);
  }
  normalize_scores(results);
  return results;
}

common::Result<std::vector<ScoredPath>> HybridSearchIndex::search_vector(const std::string &query,
                                                                         const std::size_t top_k) const {
  using VectorResult = common::Result<std::vector<ScoredPath>>;
  auto embedding = embedder_->embed(query);
  if (!embedding.ok()) {
    return VectorResult::failure("Failed to embed query: " + embedding.error(),
                                 common::ErrorCode::Embedding);
  }
  auto hits = vectors_->search(embedding.value(), top_k);
  if (!hits.ok()) {
    return VectorResult::propagate(hits);
  }

  std::vector<ScoredPath> results;
  for (const auto &hit : hits.value()) {
    // orthogonal or opposite vectors share nothing with the query
    if (hit.score > 0.0F) {
      results.push_back(ScoredPath{.path = hit.id, .score = static_cast<double>(hit.score)});
    }
  }
  normalize_scores(results);
  return VectorResult::success(std::move(results));
}

common::Result<std::vector<SearchHit>> HybridSearchIndex::search(const std::string &query,
                                                                 const SearchOptions &options) const {
  using SearchResult = common::Result<std::vector<SearchHit>>;
  std::vector<SearchHit> hits;
  if (common::trim(query).empty() || options.top_k == 0) {
    return SearchResult::success(std::move(hits));
  }

  if (options.mode == SearchMode::Bm25) {
    auto bm25 = search_bm25(query);
    for (auto &result : bm25) {
      if (hits.size() >= options.top_k) {
        break;
      }
      hits.push_back(SearchHit{.path = std::move(result.path),
                               .score = result.score,
                               .bm25_score = result.score,
                               .vector_score = std::nullopt});
    }
  } else if (options.mode == SearchMode::Vector) {
    auto vector = search_vector(query, options.top_k);
    if (!vector.ok()) {
      return SearchResult::propagate(vector);
    }
    for (auto &result : vector.value()) {
      hits.push_back(SearchHit{.path = std::move(result.path),
                               .score = result.score,
                               .bm25_score = std::nullopt,
                               .vector_score = result.score});
    }
  } else {
    const auto bm25 = search_bm25(query);
    auto vector = search_vector(query, options.top_k);
    if (!vector.ok()) {
      return SearchResult::propagate(vector);
    }

    std::vector<SearchHit> combined;
    std::unordered_map<std::string, std::size_t> positions;
    const auto slot = [&](const std::string &path) -> SearchHit & {
      const auto [it, inserted] = positions.emplace(path, combined.size());
      if (inserted) {
        combined.push_back(SearchHit{.path = path});
      }
      return combined[it->second];
    };
    constexpr std::size_t kPoolFactor = 3;
    const std::size_t pool_limit =
        options.top_k > std::numeric_limits<std::size_t>::max() / kPoolFactor
            ? std::numeric_limits<std::size_t>::max()
            : options.top_k * kPoolFactor;
    const std::size_t pool = std::min(bm25.size(), pool_limit);
    for (std::size_t i = 0; i < pool; ++i) {
      slot(bm25[i].path).bm25_score = bm25[i].score;
    }
    for (const auto &result : vector.value()) {
      slot(result.path).vector_score = result.score;
    }

    const double weight = std::clamp(options.vector_weight, 0.0, 1.0);
    for (auto &hit : combined) {
      hit.score = weight * hit.vector_score.value_or(0.0) +
                  (1.0 - weight) * hit.bm25_score.value_or(0.0);
    }
    std::stable_sort(combined.begin(), combined.end(),
                     [](const SearchHit &lhs, const SearchHit &rhs) { return lhs.score > rhs.score; });
    if (combined.size() > options.top_k) {
      combined.resize(options.top_k);
    }
    hits = std::move(combined);
  }

  hits.erase(std::remove_if(hits.begin(), hits.end(),
                            [&](const SearchHit &hit) { return hit.score < options.min_score; }),
             hits.end());
  return SearchResult::success(std::move(hits));
}

std::optional<IndexedDocument> HybridSearchIndex::get(const std::string &path) const {
  std::shared_lock lock(mutex_);
  const auto it = documents_.find(path);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<IndexedDocument> HybridSearchIndex::list() const {
  std::vector<IndexedDocument> documents;
  {
    std::shared_lock lock(mutex_);
    documents.reserve(documents_.size());
    for (const auto &[_, document] : documents_) {
      documents.push_back(document);
    }
  }
  std::sort(documents.begin(), documents.end(),
            [](const IndexedDocument &lhs, const IndexedDocument &rhs) { return lhs.path < rhs.path; });
  return documents;
}

std::size_t HybridSearchIndex::size() const {
  std::shared_lock lock(mutex_);
  return documents_.size();
}

} // namespace agentfs::search
