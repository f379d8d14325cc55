#include "modules/covmark/parse_date.h"
#include "modules/covmark/covmark.h"

#include <gtest/gtest.h>

namespace covmark {

TEST(parse_date_test, fast_path) {
  COVMARK_CHECK("fast-path");
  COVMARK_CHECK_NEVER("slow-path");
  auto date = parse_date("2013-02-27");
  ASSERT_TRUE(date);
  EXPECT_EQ(2013, date->year);
  EXPECT_EQ(2, date->month);
  EXPECT_EQ(27, date->day);
}

TEST(parse_date_test, slow_path_input_misses_fast_path) {
  try {
    COVMARK_CHECK("fast-path");
    EXPECT_FALSE(parse_date("27.2.2013"));
  } catch (const check_failure& failure) {
    ASSERT_EQ(1, failure.failures().size());
    EXPECT_EQ(mark_failure::kind::never_hit, failure.failures()[0].failure_kind);
    EXPECT_EQ("fast-path", failure.failures()[0].name);
    return;
  }
  FAIL() << "Expected check_failure for fast-path";
}

TEST(parse_date_test, short_date) {
  COVMARK_CHECK("short date");
  EXPECT_FALSE(parse_date("92"));
}

TEST(parse_date_test, wrong_dashes) {
  COVMARK_CHECK("wrong dashes");
  COVMARK_CHECK_NEVER("short date");
  EXPECT_FALSE(parse_date("27.02.2013"));
}

TEST(parse_date_test, looks_like_wrong_dashes_but_is_short) {
  // "27.2.2013" is nine characters long, so it never reaches the dash check.
  COVMARK_CHECK("short date");
  COVMARK_CHECK_NEVER("wrong dashes");
  EXPECT_FALSE(parse_date("27.2.2013"));
}

TEST(parse_date_test, non_digit) {
  COVMARK_CHECK("non-digit in date");
  EXPECT_FALSE(parse_date("2013-0x-27"));
}

TEST(parse_date_test, out_of_range) {
  COVMARK_CHECK_COUNT("date out of range", 2);
  EXPECT_FALSE(parse_date("2013-13-01"));
  EXPECT_FALSE(parse_date("2013/01/32"));
}

TEST(parse_date_test, slashes_and_whitespace) {
  COVMARK_CHECK_COUNT("slow-path", 2);
  COVMARK_CHECK_COUNT("trimmed whitespace", 1);
  COVMARK_CHECK_NEVER("fast-path");
  auto date = parse_date("2013/02/27");
  ASSERT_TRUE(date);
  EXPECT_EQ(calendar_date({2013, 2, 27}), *date);

  date = parse_date("  1914-08-26\n");
  ASSERT_TRUE(date);
  EXPECT_EQ(calendar_date({1914, 8, 26}), *date);
}

TEST(parse_date_test, nested_checks) {
  COVMARK_CHECK_COUNT("slow-path", 2);
  {
    COVMARK_CHECK("short date");
    EXPECT_FALSE(parse_date("1914"));
  }
  {
    COVMARK_CHECK("wrong dashes");
    EXPECT_FALSE(parse_date("1914+08+26"));
  }
  EXPECT_EQ(1, check_state::global().open_scopes());
}

TEST(parse_date_test, mark_function) {
  check_guard guard({{"custom mark", expectation::exactly(2)}});
  mark("custom mark");
  mark("custom mark");
  mark("unrelated mark");
  EXPECT_EQ(2, guard.observed("custom mark"));
}

TEST(parse_date_test, call_sites_register_marks) {
  parse_date("2013-02-27");
  EXPECT_TRUE(check_state::global().registry().is_registered("fast-path"));
}

}  // namespace covmark
