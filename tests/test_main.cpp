#include "test_framework.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

void register_async_tests(std::vector<launchpad::tests::TestCase> &tests);
void register_filter_tests(std::vector<launchpad::tests::TestCase> &tests);
void register_polling_tests(std::vector<launchpad::tests::TestCase> &tests);
void register_manager_tests(std::vector<launchpad::tests::TestCase> &tests);
void register_summary_tests(std::vector<launchpad::tests::TestCase> &tests);
void register_backend_tests(std::vector<launchpad::tests::TestCase> &tests);
void register_config_tests(std::vector<launchpad::tests::TestCase> &tests);
void register_cli_tests(std::vector<launchpad::tests::TestCase> &tests);

int main(int argc, char **argv) {
  std::vector<launchpad::tests::TestCase> tests;
  register_async_tests(tests);
  register_filter_tests(tests);
  register_polling_tests(tests);
  register_manager_tests(tests);
  register_summary_tests(tests);
  register_backend_tests(tests);
  register_config_tests(tests);
  register_cli_tests(tests);

  const std::string filter = argc > 1 ? argv[1] : "";

  std::size_t passed = 0;
  std::size_t failed = 0;
  for (const auto &test : tests) {
    if (!filter.empty() && test.name.find(filter) == std::string::npos) {
      continue;
    }
    try {
      test.fn();
      ++passed;
      std::cout << "[PASS] " << test.name << "\n";
    } catch (const std::exception &ex) {
      ++failed;
      std::cout << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "\n" << passed << " passed, " << failed << " failed\n";
  return failed == 0 ? 0 : 1;
}
