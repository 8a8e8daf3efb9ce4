#pragma once

#include "agentfs/common/result.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentfs::search {

using VectorMetadata = std::unordered_map<std::string, std::string>;

struct VectorHit {
  std::string id;
  /// Cosine similarity in [-1, 1].
  float score = 0.0F;
  VectorMetadata metadata;
};

class IVectorStore {
public:
  virtual ~IVectorStore() = default;

  [[nodiscard]] virtual common::Status store(const std::string &id,
                                             const std::vector<float> &embedding,
                                             const VectorMetadata &metadata) = 0;
  [[nodiscard]] virtual common::Result<std::vector<VectorHit>>
  search(const std::vector<float> &query, std::size_t limit) const = 0;
  [[nodiscard]] virtual common::Status remove(const std::string &id) = 0;
  [[nodiscard]] virtual std::size_t size() const = 0;
};

class InMemoryVectorStore : public IVectorStore {
public:
  [[nodiscard]] common::Status store(const std::string &id, const std::vector<float> &embedding,
                                     const VectorMetadata &metadata) override;
  [[nodiscard]] common::Result<std::vector<VectorHit>> search(const std::vector<float> &query,
                                                              std::size_t limit) const override;
  [[nodiscard]] common::Status remove(const std::string &id) override;
  [[nodiscard]] std::size_t size() const override;
  [[nodiscard]] bool contains(const std::string &id) const;

private:
  struct Entry {
    std::vector<float> embedding;
    VectorMetadata metadata;
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

[[nodiscard]] float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

} // namespace agentfs::search
