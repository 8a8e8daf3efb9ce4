#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<agentfs::tests::TestCase> &tests);
void register_config_tests(std::vector<agentfs::tests::TestCase> &tests);
void register_workspace_tests(std::vector<agentfs::tests::TestCase> &tests);
void register_filesystem_tests(std::vector<agentfs::tests::TestCase> &tests);
void register_search_tests(std::vector<agentfs::tests::TestCase> &tests);
void register_embedder_tests(std::vector<agentfs::tests::TestCase> &tests);
void register_tools_tests(std::vector<agentfs::tests::TestCase> &tests);
void register_observability_tests(std::vector<agentfs::tests::TestCase> &tests);
void register_cli_tests(std::vector<agentfs::tests::TestCase> &tests);
void register_workspace_integration_tests(std::vector<agentfs::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<agentfs::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_workspace_tests(tests);
  register_filesystem_tests(tests);
  register_search_tests(tests);
  register_embedder_tests(tests);
  register_tools_tests(tests);
  register_observability_tests(tests);
  register_cli_tests(tests);
  register_workspace_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";
  return failed == 0 ? 0 : 1;
}
