#pragma once

// Coverage marks tie tests to the code they are meant to exercise.
//
// In the code under test, name the interesting places:
//
//   if (s.size() != 10) {
//     COVMARK_HIT("short date");
//     return boost::none;
//   }
//
// In the test, say which of them must run:
//
//   TEST(parse_date_test, short_date) {
//     COVMARK_CHECK("short date");
//     EXPECT_FALSE(parse_date("92"));
//   }
//
// If the check is still open at the end of the block and "short date"
// was never hit on this thread, the test fails with check_failure.
// Mark names must be string literals so that grepping for a name finds
// both the instrumented code and every test that covers it.
//
// COVMARK_ENABLED selects whether any of this does anything.  When it
// is 0 every macro below compiles to nothing and covmark::mark and
// covmark::check_guard are empty inline no-ops, so instrumented code
// can ship in release builds.  If COVMARK_ENABLED isn't defined it
// follows NDEBUG: checks are on in debug builds.
//
// When enabled, checking can also be turned off at runtime with
// COVMARK_CHECKS=0 in the environment or check_state::set_enabled.

#include <string>

#include "absl/strings/string_view.h"
#include "modules/covmark/expectation.h"

#ifndef COVMARK_ENABLED
#ifdef NDEBUG
#define COVMARK_ENABLED 0
#else
#define COVMARK_ENABLED 1
#endif
#endif

#define COVMARK_CONCAT_INNER(A, B) A##B
#define COVMARK_CONCAT(A, B) COVMARK_CONCAT_INNER(A, B)

#if COVMARK_ENABLED

#include "modules/covmark/check_scope.h"
#include "modules/covmark/check_state.h"

namespace covmark {

// Notes that the mark "name" was reached.
inline void mark(absl::string_view name) { check_state::global().hit(name); }

using check_guard = check_scope;

}  // namespace covmark

// Notes that this point was reached.  NAME must be a string literal.
// The mark is registered once per call site.
#define COVMARK_HIT(NAME)                                                  \
  do {                                                                     \
    ::covmark::check_state& covmark_state_ = ::covmark::check_state::global(); \
    if (covmark_state_.enabled()) {                                        \
      static const ::covmark::mark_handle covmark_mark_ =                  \
          covmark_state_.registry().register_mark("" NAME "");             \
      covmark_state_.hit(covmark_mark_);                                   \
    }                                                                      \
  } while (0)

// Notes that this point was reached with CONDITION true.  CONDITION is
// only evaluated when some scope on this thread could be watching.
#define COVMARK_HIT_IF(NAME, CONDITION)                                    \
  do {                                                                     \
    ::covmark::check_state& covmark_state_ = ::covmark::check_state::global(); \
    if (covmark_state_.enabled() && covmark_state_.open_scopes() != 0 &&   \
        (CONDITION)) {                                                     \
      static const ::covmark::mark_handle covmark_mark_ =                  \
          covmark_state_.registry().register_mark("" NAME "");             \
      covmark_state_.hit(covmark_mark_);                                   \
    }                                                                      \
  } while (0)

// Requires NAME to be hit at least once before the enclosing block ends.
#define COVMARK_CHECK(NAME)                                             \
  ::covmark::check_scope COVMARK_CONCAT(covmark_check_, __LINE__)( \
      ::covmark::expectations{{"" NAME "", ::covmark::expectation::at_least_once()}})

// Requires NAME to be hit exactly COUNT times before the enclosing block ends.
#define COVMARK_CHECK_COUNT(NAME, COUNT)                                \
  ::covmark::check_scope COVMARK_CONCAT(covmark_check_, __LINE__)( \
      ::covmark::expectations{{"" NAME "", ::covmark::expectation::exactly(COUNT)}})

// Requires NAME not to be hit before the enclosing block ends.
#define COVMARK_CHECK_NEVER(NAME)                                       \
  ::covmark::check_scope COVMARK_CONCAT(covmark_check_, __LINE__)( \
      ::covmark::expectations{{"" NAME "", ::covmark::expectation::never()}})

#else  // !COVMARK_ENABLED

namespace covmark {

inline void mark(absl::string_view) {}

// Stand-in for check_scope when checks are compiled out.
class check_guard {
 public:
  explicit check_guard(const std::string&) {}
  explicit check_guard(const expectations&) {}
  check_guard(const check_guard&) = delete;
  check_guard& operator=(const check_guard&) = delete;

  bool active() const { return false; }
  size_t observed(absl::string_view) const { return 0; }
};

}  // namespace covmark

#define COVMARK_HIT(NAME) static_assert(true, "")
#define COVMARK_HIT_IF(NAME, CONDITION) static_assert(true, "")
#define COVMARK_CHECK(NAME) static_assert(true, "")
#define COVMARK_CHECK_COUNT(NAME, COUNT) static_assert(true, "")
#define COVMARK_CHECK_NEVER(NAME) static_assert(true, "")

#endif  // COVMARK_ENABLED
