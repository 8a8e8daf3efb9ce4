#include "agentfs/search/sqlite_vector_store.hpp"

#include "agentfs/common/json_util.hpp"
#include "sqlite_util.hpp"

#include <algorithm>
#include <sstream>

namespace agentfs::search {

namespace {

std::string metadata_to_json(const VectorMetadata &metadata) {
  std::vector<std::pair<std::string, std::string>> sorted(metadata.begin(), metadata.end());
  std::sort(sorted.begin(), sorted.end());
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[key, value] : sorted) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << "\"" << common::json_escape(key) << "\":\"" << common::json_escape(value) << "\"";
  }
  out << "}";
  return out.str();
}

} // namespace

SqliteVectorStore::SqliteVectorStore(std::filesystem::path db_path, std::string collection)
    : db_path_(std::move(db_path)), collection_(std::move(collection)) {}

SqliteVectorStore::~SqliteVectorStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteVectorStore::open() {
  std::lock_guard<std::mutex> lock(db_mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
  }

  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    const std::string message = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return common::Status::error("Failed to open vector store: " + message,
                                 common::ErrorCode::VectorStore);
  }

  auto status = detail::exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  status = detail::exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS vectors (
  collection TEXT NOT NULL,
  id TEXT NOT NULL,
  embedding BLOB NOT NULL,
  metadata TEXT NOT NULL DEFAULT '{}',
  PRIMARY KEY (collection, id)
);
)");
  if (!status.ok()) {
    return status;
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT id, embedding, metadata FROM vectors WHERE collection = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::VectorStore);
  }
  sqlite3_bind_text(stmt, 1, collection_.c_str(), -1, SQLITE_TRANSIENT);
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    const auto *id = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
    const auto *metadata = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 2));
    auto embedding =
        detail::blob_to_vector(sqlite3_column_blob(stmt, 1), sqlite3_column_bytes(stmt, 1));
    VectorMetadata parsed;
    for (auto &[key, value] : common::json_parse_flat(metadata == nullptr ? "{}" : metadata)) {
      parsed.emplace(key, std::move(value));
    }
    auto loaded = cache_.store(id == nullptr ? "" : id, embedding, parsed);
    if (!loaded.ok()) {
      sqlite3_finalize(stmt);
      return loaded;
    }
  }
  sqlite3_finalize(stmt);
  return common::Status::success();
}

common::Status SqliteVectorStore::store(const std::string &id, const std::vector<float> &embedding,
                                        const VectorMetadata &metadata) {
  {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_ == nullptr) {
      return common::Status::error("vector store is not open", common::ErrorCode::VectorStore);
    }
    const auto blob = detail::vector_to_blob(embedding);
    const std::string metadata_json = metadata_to_json(metadata);

    sqlite3_stmt *stmt = nullptr;
    const char *sql = "INSERT OR REPLACE INTO vectors(collection, id, embedding, metadata) "
                      "VALUES(?1, ?2, ?3, ?4)";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::VectorStore);
    }
    sqlite3_bind_text(stmt, 1, collection_.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 3, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, metadata_json.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::VectorStore);
    }
  }
  return cache_.store(id, embedding, metadata);
}

common::Result<std::vector<VectorHit>> SqliteVectorStore::search(const std::vector<float> &query,
                                                                 const std::size_t limit) const {
  return cache_.search(query, limit);
}

common::Status SqliteVectorStore::remove(const std::string &id) {
  {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_ == nullptr) {
      return common::Status::error("vector store is not open", common::ErrorCode::VectorStore);
    }
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "DELETE FROM vectors WHERE collection = ?1 AND id = ?2";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::VectorStore);
    }
    sqlite3_bind_text(stmt, 1, collection_.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::VectorStore);
    }
  }
  return cache_.remove(id);
}

std::size_t SqliteVectorStore::size() const { return cache_.size(); }

} // namespace agentfs::search
