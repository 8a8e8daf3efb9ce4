#pragma once

#include "agentfs/search/vector_store.hpp"

#include <filesystem>

struct sqlite3;

namespace agentfs::search {

/// Durable vector store: rows in a SQLite table, mirrored in memory for search.
class SqliteVectorStore final : public IVectorStore {
public:
  explicit SqliteVectorStore(std::filesystem::path db_path, std::string collection = "default");
  ~SqliteVectorStore() override;

  SqliteVectorStore(const SqliteVectorStore &) = delete;
  SqliteVectorStore &operator=(const SqliteVectorStore &) = delete;

  /// Opens the database, creates the schema and loads existing rows.
  [[nodiscard]] common::Status open();

  [[nodiscard]] common::Status store(const std::string &id, const std::vector<float> &embedding,
                                     const VectorMetadata &metadata) override;
  [[nodiscard]] common::Result<std::vector<VectorHit>> search(const std::vector<float> &query,
                                                              std::size_t limit) const override;
  [[nodiscard]] common::Status remove(const std::string &id) override;
  [[nodiscard]] std::size_t size() const override;

private:
  std::filesystem::path db_path_;
  std::string collection_;
  sqlite3 *db_ = nullptr;
  std::mutex db_mutex_;
  InMemoryVectorStore cache_;
};

} // namespace agentfs::search
