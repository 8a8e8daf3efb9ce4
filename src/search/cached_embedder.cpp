#include "agentfs/search/cached_embedder.hpp"

#include "sqlite_util.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace agentfs::search {

std::string sha256_hex(const std::string_view text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

CachedEmbedder::CachedEmbedder(std::shared_ptr<IEmbedder> inner, std::filesystem::path db_path,
                               const std::size_t max_entries)
    : inner_(std::move(inner)), db_path_(std::move(db_path)), max_entries_(max_entries) {}

CachedEmbedder::~CachedEmbedder() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status CachedEmbedder::open() {
  std::lock_guard<std::mutex> lock(mutex_);
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
    return common::Status::error("Failed to open embedding cache: " + message,
                                 common::ErrorCode::Embedding);
  }

  auto status = detail::exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS embedding_cache (
  text_hash TEXT PRIMARY KEY,
  embedding BLOB NOT NULL,
  seq INTEGER NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*), COALESCE(MAX(seq), 0) FROM embedding_cache", -1,
                         &stmt, nullptr) == SQLITE_OK) {
    if (sqlite3_step(stmt) == SQLITE_ROW) {
      stats_.size = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
      sequence_ = sqlite3_column_int64(stmt, 1);
    }
    sqlite3_finalize(stmt);
  }
  return common::Status::success();
}

std::string CachedEmbedder::cache_key(const std::string_view text) const {
  std::string material(inner_->name());
  material += ":" + std::to_string(inner_->dimensions()) + ":";
  material.append(text.data(), text.size());
  return sha256_hex(material);
}

common::Result<std::optional<std::vector<float>>> CachedEmbedder::lookup(const std::string &key) {
  using LookupResult = common::Result<std::optional<std::vector<float>>>;
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT embedding FROM embedding_cache WHERE text_hash = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return LookupResult::failure(sqlite3_errmsg(db_), common::ErrorCode::Embedding);
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<std::vector<float>> found;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    found = detail::blob_to_vector(sqlite3_column_blob(stmt, 0), sqlite3_column_bytes(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return LookupResult::success(std::move(found));
}

common::Status CachedEmbedder::store(const std::string &key, const std::vector<float> &embedding) {
  const auto blob = detail::vector_to_blob(embedding);

  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT OR REPLACE INTO embedding_cache(text_hash, embedding, seq) VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::Embedding);
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, ++sequence_);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::Embedding);
  }

  sqlite3_stmt *count_stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache", -1, &count_stmt, nullptr) ==
      SQLITE_OK) {
    if (sqlite3_step(count_stmt) == SQLITE_ROW) {
      stats_.size = static_cast<std::size_t>(sqlite3_column_int64(count_stmt, 0));
    }
    sqlite3_finalize(count_stmt);
  }

  if (max_entries_ > 0 && stats_.size > max_entries_) {
    const std::size_t overflow = stats_.size - max_entries_;
    std::ostringstream trim_sql;
    trim_sql << "DELETE FROM embedding_cache WHERE text_hash IN ("
             << "SELECT text_hash FROM embedding_cache ORDER BY seq ASC LIMIT " << overflow << ")";
    auto trim_status = detail::exec_sql(db_, trim_sql.str());
    if (!trim_status.ok()) {
      return trim_status;
    }
    stats_.size = max_entries_;
  }
  return common::Status::success();
}

common::Result<std::vector<float>> CachedEmbedder::embed(const std::string_view text) {
  const std::string key = cache_key(text);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
      return common::Result<std::vector<float>>::failure("embedding cache is not open",
                                                         common::ErrorCode::Embedding);
    }
    auto cached = lookup(key);
    if (!cached.ok()) {
      return common::Result<std::vector<float>>::propagate(cached);
    }
    if (cached.value().has_value()) {
      ++stats_.hits;
      return common::Result<std::vector<float>>::success(std::move(*cached.value()));
    }
    ++stats_.misses;
  }

  auto embedded = inner_->embed(text);
  if (!embedded.ok()) {
    return embedded;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = store(key, embedded.value()); !status.ok()) {
    return common::Result<std::vector<float>>::propagate(status);
  }
  return embedded;
}

EmbeddingCacheStats CachedEmbedder::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

} // namespace agentfs::search
