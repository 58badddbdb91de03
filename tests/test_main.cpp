#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<tai::tests::TestCase> &tests);
void register_security_tests(std::vector<tai::tests::TestCase> &tests);
void register_config_tests(std::vector<tai::tests::TestCase> &tests);
void register_observability_tests(std::vector<tai::tests::TestCase> &tests);
void register_tools_tests(std::vector<tai::tests::TestCase> &tests);
void register_search_tests(std::vector<tai::tests::TestCase> &tests);
void register_shell_tests(std::vector<tai::tests::TestCase> &tests);
void register_registry_tests(std::vector<tai::tests::TestCase> &tests);
void register_providers_tests(std::vector<tai::tests::TestCase> &tests);
void register_agent_tests(std::vector<tai::tests::TestCase> &tests);
void register_cli_tests(std::vector<tai::tests::TestCase> &tests);
void register_session_integration_tests(std::vector<tai::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<tai::tests::TestCase> tests;
  register_common_tests(tests);
  register_security_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_tools_tests(tests);
  register_search_tests(tests);
  register_shell_tests(tests);
  register_registry_tests(tests);
  register_providers_tests(tests);
  register_agent_tests(tests);
  register_cli_tests(tests);
  register_session_integration_tests(tests);

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
