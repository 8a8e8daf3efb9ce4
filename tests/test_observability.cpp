#include "test_framework.hpp"

#include "agentfs/observability/factory.hpp"
#include "agentfs/observability/log_observer.hpp"
#include "agentfs/observability/multi_observer.hpp"
#include "agentfs/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

void register_observability_tests(std::vector<agentfs::tests::TestCase> &tests) {
  using agentfs::tests::require;
  namespace obs = agentfs::observability;

  tests.push_back({"log_observer_formats_tool_events", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::ToolStartEvent{.tool = "read_file", .operation_key = "op"});
                     observer.record_event(obs::ToolEndEvent{.tool = "edit_file",
                                                             .operation_key = "op",
                                                             .duration = std::chrono::milliseconds(12),
                                                             .success = false,
                                                             .error_code = "stale_read"});
                     observer.flush();
                     const std::string text = out.str();
                     require(text.find("[DEBUG] tool.start name=read_file op=op\n") != std::string::npos,
                             "start line: " + text);
                     require(text.find("[WARN] tool.end name=edit_file op=op duration_ms=12 "
                                       "success=false code=stale_read\n") != std::string::npos,
                             "end line: " + text);
                   }});

  tests.push_back({"log_observer_formats_search_events", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(
                         obs::IndexEvent{.path = "/docs", .indexed = 3, .total_found = 4});
                     observer.record_event(obs::SearchEvent{.mode = "hybrid", .results = 2});
                     observer.record_event(obs::ErrorEvent{.component = "workspace", .message = "boom"});
                     const std::string text = out.str();
                     require(text.find("[INFO] index path=/docs indexed=3 total_found=4") !=
                                 std::string::npos,
                             "index line");
                     require(text.find("[INFO] search mode=hybrid results=2") != std::string::npos,
                             "search line");
                     require(text.find("[ERROR] workspace: boom") != std::string::npos, "error line");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     auto first = std::make_unique<agentfs::testing::RecordingObserver>();
                     auto second = std::make_unique<agentfs::testing::RecordingObserver>();
                     auto *first_raw = first.get();
                     auto *second_raw = second.get();
                     obs::MultiObserver multi;
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observers are ignored");
                     multi.record_event(obs::SearchEvent{.mode = "bm25", .results = 1});
                     require(first_raw->events().size() == 1 && second_raw->events().size() == 1,
                             "every observer receives the event");
                   }});

  tests.push_back({"observer_factory_backends", [] {
                     agentfs::config::Config config;
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none is noop");
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log, noop";
                     const auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list builds a multi observer");
                   }});
}
