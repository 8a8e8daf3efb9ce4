#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace agentfs::observability {

struct ToolStartEvent {
  std::string tool;
  std::string operation_key;
};

struct ToolEndEvent {
  std::string tool;
  std::string operation_key;
  std::chrono::milliseconds duration{0};
  bool success = false;
  std::string error_code;
};

struct IndexEvent {
  std::string path;
  std::size_t indexed = 0;
  std::size_t total_found = 0;
};

struct SearchEvent {
  std::string mode;
  std::size_t results = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ToolStartEvent, ToolEndEvent, IndexEvent, SearchEvent, ErrorEvent>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace agentfs::observability
