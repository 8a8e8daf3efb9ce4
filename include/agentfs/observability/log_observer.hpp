#pragma once

#include "agentfs/observability/observer.hpp"

#include <iostream>
#include <mutex>
#include <ostream>

namespace agentfs::observability {

/// Writes one `[LEVEL] message` line per event.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(std::ostream &out = std::cerr) : out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const std::string &level, const std::string &message);

  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace agentfs::observability
