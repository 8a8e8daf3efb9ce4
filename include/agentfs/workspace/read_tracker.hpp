#pragma once

#include "agentfs/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace agentfs::workspace {

/// Fingerprint of a file's on-disk state at the moment of a read.
struct ReadVersion {
  std::int64_t modified_at_nanos = 0;
  std::int64_t size_bytes = 0;

  bool operator==(const ReadVersion &) const = default;
};

/// Returns the current version of a workspace path, or nullopt if it does not exist.
using VersionProbe = std::function<std::optional<ReadVersion>(const std::string &)>;

struct ReadTrackerOptions {
  std::chrono::seconds ttl{3600};
  std::size_t max_operations = 1024;
  std::function<std::chrono::steady_clock::time_point()> clock;
};

/// Remembers, per operation key, the version of every path read so that a
/// later write in the same operation can detect a concurrent modification.
/// Operations expire after `ttl` of inactivity and the least recently used
/// operation is evicted beyond `max_operations` (0 disables either bound).
class ReadTracker {
public:
  ReadTracker(VersionProbe probe, ReadTrackerOptions options = {});

  void record_read(const std::string &operation_key, const std::string &path);
  /// Records a version captured before the content was read, so a change that
  /// lands during the read still surfaces as a stale read.
  void record_version(const std::string &operation_key, const std::string &path,
                      const ReadVersion &version);
  [[nodiscard]] std::optional<ReadVersion> capture(const std::string &path) const {
    return probe_(path);
  }
  [[nodiscard]] common::Status assert_read_before_write(const std::string &operation_key,
                                                        const std::string &path);

  void forget(const std::string &operation_key);
  void clear();
  [[nodiscard]] std::size_t tracked_operations() const;

private:
  struct Entry {
    std::unordered_map<std::string, ReadVersion> reads;
    std::chrono::steady_clock::time_point last_used;
    std::list<std::string>::iterator lru_position;
  };

  [[nodiscard]] std::chrono::steady_clock::time_point now() const;
  void touch_locked(const std::string &operation_key, Entry &entry,
                    std::chrono::steady_clock::time_point at);
  void evict_locked(std::chrono::steady_clock::time_point at);

  VersionProbe probe_;
  ReadTrackerOptions options_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> operations_;
  std::list<std::string> lru_;
};

} // namespace agentfs::workspace
