#include "modules/test/test_coverage.h"
#include "modules/covmark/check_scope.h"

#include <gmock/gmock.h>
#include <gtest/gtest-spi.h>
#include <gtest/gtest.h>

#include <memory>

using namespace testing;

namespace covmark {

namespace {

void check_with_gtest_reporter(size_t hits) {
  check_state state;
  state.set_reporter(std::make_unique<gtest_check_reporter>());
  check_scope scope(state, {{"fast-path", expectation::exactly(2)}});
  for (size_t i = 0; i < hits; ++i) {
    state.hit("fast-path");
  }
}

}  // namespace

TEST(test_coverage_test, gtest_reporter_passes) { check_with_gtest_reporter(2); }

TEST(test_coverage_test, gtest_reporter_adds_nonfatal_failure) {
  EXPECT_NONFATAL_FAILURE(check_with_gtest_reporter(1),
                          "mark \"fast-path\" hit 1 time (expected exactly 2 times)");
}

TEST(test_coverage_test, no_scopes_left_open) {
  EXPECT_EQ(0, check_state::global().open_scopes());
}

TEST(test_coverage_test, leaked_scope_DeathTest) {
  EXPECT_DEATH(
      {
        check_state state;
        scope_leak_listener listener(state);
        new check_scope(state, {{"leaked", expectation::never()}});
        listener.OnTestEnd(*UnitTest::GetInstance()->current_test_info());
      },
      "Unbalanced scope: 1 check scope\\(s\\) still open at the end of test "
      "test_coverage_test.leaked_scope_DeathTest");
}

TEST(test_coverage_test, balanced_scopes_pass_listener) {
  check_state state;
  scope_leak_listener listener(state);
  {
    check_scope scope(state, {{"x", expectation::never()}});
  }
  listener.OnTestEnd(*UnitTest::GetInstance()->current_test_info());
}

}  // namespace covmark
