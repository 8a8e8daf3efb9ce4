#include "agentfs/search/vector_store.hpp"

#include <algorithm>
#include <cmath>

namespace agentfs::search {

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || b.empty() || a.size() != b.size()) {
    return 0.0F;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }

  if (norm_a < 1e-9 || norm_b < 1e-9) {
    return 0.0F;
  }
  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

common::Status InMemoryVectorStore::store(const std::string &id,
                                          const std::vector<float> &embedding,
                                          const VectorMetadata &metadata) {
  if (id.empty()) {
    return common::Status::error("vector id must not be empty", common::ErrorCode::VectorStore);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[id] = Entry{.embedding = embedding, .metadata = metadata};
  return common::Status::success();
}

common::Result<std::vector<VectorHit>> InMemoryVectorStore::search(const std::vector<float> &query,
                                                                   const std::size_t limit) const {
  std::vector<VectorHit> hits;
  if (query.empty() || limit == 0) {
    return common::Result<std::vector<VectorHit>>::success(std::move(hits));
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    hits.reserve(entries_.size());
    for (const auto &[id, entry] : entries_) {
      if (entry.embedding.size() != query.size()) {
        continue;
      }
      hits.push_back(VectorHit{.id = id,
                               .score = cosine_similarity(query, entry.embedding),
                               .metadata = entry.metadata});
    }
  }

  std::sort(hits.begin(), hits.end(), [](const VectorHit &lhs, const VectorHit &rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.id < rhs.id;
  });
  if (hits.size() > limit) {
    hits.resize(limit);
  }
  return common::Result<std::vector<VectorHit>>::success(std::move(hits));
}

common::Status InMemoryVectorStore::remove(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(id);
  return common::Status::success();
}

std::size_t InMemoryVectorStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

bool InMemoryVectorStore::contains(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.contains(id);
}

} // namespace agentfs::search
