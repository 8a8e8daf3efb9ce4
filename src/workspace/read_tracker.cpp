#include "agentfs/workspace/read_tracker.hpp"

namespace agentfs::workspace {

ReadTracker::ReadTracker(VersionProbe probe, ReadTrackerOptions options)
    : probe_(std::move(probe)), options_(std::move(options)) {}

std::chrono::steady_clock::time_point ReadTracker::now() const {
  return options_.clock ? options_.clock() : std::chrono::steady_clock::now();
}

void ReadTracker::touch_locked(const std::string &operation_key, Entry &entry,
                               const std::chrono::steady_clock::time_point at) {
  entry.last_used = at;
  lru_.erase(entry.lru_position);
  lru_.push_front(operation_key);
  entry.lru_position = lru_.begin();
}

void ReadTracker::evict_locked(const std::chrono::steady_clock::time_point at) {
  if (options_.ttl.count() > 0) {
    while (!lru_.empty()) {
      const auto it = operations_.find(lru_.back());
      if (it == operations_.end() || at - it->second.last_used < options_.ttl) {
        break;
      }
      operations_.erase(it);
      lru_.pop_back();
    }
  }
  if (options_.max_operations > 0) {
    while (operations_.size() > options_.max_operations && !lru_.empty()) {
      operations_.erase(lru_.back());
      lru_.pop_back();
    }
  }
}

void ReadTracker::record_read(const std::string &operation_key, const std::string &path) {
  // stat outside the lock
  const auto version = probe_(path);
  if (!version.has_value()) {
    return;
  }
  record_version(operation_key, path, *version);
}

void ReadTracker::record_version(const std::string &operation_key, const std::string &path,
                                 const ReadVersion &version) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto at = now();
  evict_locked(at);

  auto it = operations_.find(operation_key);
  if (it == operations_.end()) {
    lru_.push_front(operation_key);
    it = operations_.emplace(operation_key, Entry{.reads = {}, .last_used = at, .lru_position = lru_.begin()})
             .first;
  } else {
    touch_locked(operation_key, it->second, at);
  }
  it->second.reads[path] = version;
  evict_locked(at);
}

common::Status ReadTracker::assert_read_before_write(const std::string &operation_key,
                                                     const std::string &path) {
  std::optional<ReadVersion> recorded;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto at = now();
    evict_locked(at);
    const auto it = operations_.find(operation_key);
    if (it != operations_.end()) {
      touch_locked(operation_key, it->second, at);
      if (const auto read = it->second.reads.find(path); read != it->second.reads.end()) {
        recorded = read->second;
      }
    }
  }

  if (!recorded.has_value()) {
    return common::Status::error("File must be read before it is modified: " + path,
                                 common::ErrorCode::ReadRequired);
  }

  const auto current = probe_(path);
  if (!current.has_value()) {
    return common::Status::error("File no longer exists since it was read: " + path,
                                 common::ErrorCode::StaleRead);
  }
  if (*current != *recorded) {
    return common::Status::error("File changed since it was read: " + path +
                                     "; read it again before modifying",
                                 common::ErrorCode::StaleRead);
  }
  return common::Status::success();
}

void ReadTracker::forget(const std::string &operation_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = operations_.find(operation_key);
  if (it == operations_.end()) {
    return;
  }
  lru_.erase(it->second.lru_position);
  operations_.erase(it);
}

void ReadTracker::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  operations_.clear();
  lru_.clear();
}

std::size_t ReadTracker::tracked_operations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return operations_.size();
}

} // namespace agentfs::workspace
