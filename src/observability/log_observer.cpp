#include "agentfs/observability/log_observer.hpp"

#include <type_traits>

namespace agentfs::observability {

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ToolStartEvent>) {
          log_line("DEBUG", "tool.start name=" + evt.tool + " op=" + evt.operation_key);
        } else if constexpr (std::is_same_v<T, ToolEndEvent>) {
          std::string line = "tool.end name=" + evt.tool + " op=" + evt.operation_key +
                             " duration_ms=" + std::to_string(evt.duration.count()) +
                             " success=" + (evt.success ? "true" : "false");
          if (!evt.error_code.empty()) {
            line += " code=" + evt.error_code;
          }
          log_line(evt.success ? "INFO" : "WARN", line);
        } else if constexpr (std::is_same_v<T, IndexEvent>) {
          log_line("INFO", "index path=" + evt.path + " indexed=" + std::to_string(evt.indexed) +
                               " total_found=" + std::to_string(evt.total_found));
        } else if constexpr (std::is_same_v<T, SearchEvent>) {
          log_line("INFO", "search mode=" + evt.mode + " results=" + std::to_string(evt.results));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace agentfs::observability
