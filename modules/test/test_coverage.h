#pragma once

// GoogleTest integration for coverage marks.  See
// modules/covmark/covmark.h for the marks themselves.

#include <gtest/gtest.h>

#include "modules/covmark/check_reporter.h"
#include "modules/covmark/check_state.h"

namespace covmark {

// Verifies that no check scope is left open on the test thread when a
// test starts or ends.  A leaked scope would collect hits meant for
// the next test, so this is a fatal usage fault rather than a test
// failure.
class scope_leak_listener : public ::testing::EmptyTestEventListener {
 public:
  explicit scope_leak_listener(check_state& state = check_state::global()) : m_state(state) {}

  void OnTestStart(const ::testing::TestInfo& test_info) override;
  void OnTestEnd(const ::testing::TestInfo& test_info) override;

 private:
  void verify_empty(const ::testing::TestInfo& test_info, const char* boundary);

  check_state& m_state;
};

// Reports failed checks as non-fatal gtest failures instead of
// throwing.  Nothing is reported if the test already has a fatal
// failure, since the check most likely failed as a consequence.
class gtest_check_reporter : public check_reporter {
 public:
  void report_failures(const std::vector<mark_failure>& failures) override;
};

// Installs scope_leak_listener for check_state::global() into the
// gtest listener list.  Called by the shared gtest_main.
void install_covmark_test_hooks();

}  // namespace covmark
