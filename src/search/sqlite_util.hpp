#pragma once

#include "agentfs/common/result.hpp"

#include <sqlite3.h>

#include <cstring>
#include <string>
#include <vector>

namespace agentfs::search::detail {

inline common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg, common::ErrorCode::VectorStore);
  }
  return common::Status::success();
}

inline std::vector<unsigned char> vector_to_blob(const std::vector<float> &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), values.data(), blob.size());
  }
  return blob;
}

inline std::vector<float> blob_to_vector(const void *blob, const int bytes) {
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(float)) != 0)) {
    return {};
  }
  std::vector<float> values(static_cast<std::size_t>(bytes) / sizeof(float));
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  return values;
}

} // namespace agentfs::search::detail
