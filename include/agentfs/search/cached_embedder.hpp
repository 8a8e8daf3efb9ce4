#pragma once

#include "agentfs/search/embedder.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

struct sqlite3;

namespace agentfs::search {

struct EmbeddingCacheStats {
  std::size_t hits = 0;
  std::size_t misses = 0;
  std::size_t size = 0;
};

/// Decorator persisting embeddings in SQLite keyed by the SHA-256 of
/// `model:text`, trimmed oldest-first beyond `max_entries`.
class CachedEmbedder final : public IEmbedder {
public:
  CachedEmbedder(std::shared_ptr<IEmbedder> inner, std::filesystem::path db_path,
                 std::size_t max_entries);
  ~CachedEmbedder() override;

  CachedEmbedder(const CachedEmbedder &) = delete;
  CachedEmbedder &operator=(const CachedEmbedder &) = delete;

  [[nodiscard]] common::Status open();

  [[nodiscard]] std::string_view name() const override { return inner_->name(); }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return inner_->dimensions(); }

  [[nodiscard]] EmbeddingCacheStats stats() const;

private:
  [[nodiscard]] std::string cache_key(std::string_view text) const;
  [[nodiscard]] common::Result<std::optional<std::vector<float>>> lookup(const std::string &key);
  [[nodiscard]] common::Status store(const std::string &key, const std::vector<float> &embedding);

  std::shared_ptr<IEmbedder> inner_;
  std::filesystem::path db_path_;
  std::size_t max_entries_;
  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
  EmbeddingCacheStats stats_;
  std::int64_t sequence_ = 0;
};

[[nodiscard]] std::string sha256_hex(std::string_view text);

} // namespace agentfs::search
