#include "test_runner_utils.hpp"
#include "log.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using ftr::test::TestCase;

int main(int argc, char** argv) {
  bool verbose = (std::getenv("FTR_TEST_VERBOSE") != nullptr);
  std::string filter;
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else {
      filter = arg;
    }
  }

  bool show_logs = (std::getenv("FTR_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  init(verbose);
  if(suppress_logs) {
    set_log_passthrough(false);
  }

  std::vector<TestCase> all;
  ftr::test::add_archiver_tests(all);
  ftr::test::add_http_tests(all);
  ftr::test::add_upload_tests(all);
  ftr::test::add_discovery_tests(all);
  ftr::test::add_transfer_tests(all);
  ftr::test::add_cli_tests(all);

  std::vector<TestCase> tests;
  for(auto& test : all) {
    if(filter.empty() || std::string(test.name).find(filter) != std::string::npos) {
      tests.push_back(std::move(test));
    }
  }

  ftr::test::LogCapture logs;
  ftr::test::TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " ftr tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    std::string reason;
    try {
      passed = test.fn(ctx);
    } catch(const ftr::test::TestFailure& e) {
      reason = e.what();
    } catch(const std::exception& e) {
      reason = std::string("exception: ") + e.what();
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      if(!reason.empty()) {
        std::cout << "    " << reason << "\n";
      }
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " ftr tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
