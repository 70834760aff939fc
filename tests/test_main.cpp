#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_token_tests(std::vector<pairgate::tests::TestCase> &tests);
void register_access_code_tests(std::vector<pairgate::tests::TestCase> &tests);
void register_device_store_tests(std::vector<pairgate::tests::TestCase> &tests);
void register_store_lock_tests(std::vector<pairgate::tests::TestCase> &tests);
void register_requests_tests(std::vector<pairgate::tests::TestCase> &tests);
void register_auth_gateway_tests(std::vector<pairgate::tests::TestCase> &tests);
void register_tunnel_tests(std::vector<pairgate::tests::TestCase> &tests);
void register_gateway_tests(std::vector<pairgate::tests::TestCase> &tests);
void register_config_tests(std::vector<pairgate::tests::TestCase> &tests);
void register_observability_tests(std::vector<pairgate::tests::TestCase> &tests);
void register_cli_tests(std::vector<pairgate::tests::TestCase> &tests);
void register_gateway_integration_tests(std::vector<pairgate::tests::TestCase> &tests);

int main(int argc, char **argv) {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<pairgate::tests::TestCase> tests;
  register_token_tests(tests);
  register_access_code_tests(tests);
  register_device_store_tests(tests);
  register_store_lock_tests(tests);
  register_requests_tests(tests);
  register_auth_gateway_tests(tests);
  register_tunnel_tests(tests);
  register_gateway_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_cli_tests(tests);
  register_gateway_integration_tests(tests);

  const std::string filter = argc > 1 ? argv[1] : "";

  std::size_t ran = 0;
  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    if (!filter.empty() && test.name.find(filter) == std::string::npos) {
      continue;
    }
    ++ran;
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << ran << " tests: " << passed << " passed, " << failed << " failed\n";

  return failed == 0 ? 0 : 1;
}
