#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace covmark {

// What a check_scope requires of a single mark while it is open.
class expectation {
 public:
  enum class mode { at_least_once, exact_count };

  // The mark must be hit one or more times.
  static expectation at_least_once() { return expectation(mode::at_least_once, 1); }
  // The mark must be hit exactly "count" times.
  static expectation exactly(size_t count) { return expectation(mode::exact_count, count); }
  // The mark must not be hit at all.
  static expectation never() { return exactly(0); }

  expectation() = default;

  size_t count() const { return m_count; }

  bool satisfied_by(size_t observed) const {
    if (m_mode == mode::at_least_once) {
      return observed >= 1;
    }
    return observed == m_count;
  }

  // Human readable form, e.g. "at least once" or "exactly 3 times".
  std::string describe() const;

  bool operator==(const expectation& rhs) const {
    return m_mode == rhs.m_mode && m_count == rhs.m_count;
  }
  bool operator!=(const expectation& rhs) const { return !(*this == rhs); }

 private:
  expectation(mode m, size_t count) : m_mode(m), m_count(count) {}

  mode m_mode = mode::at_least_once;
  size_t m_count = 1;
};

// Expected marks for a check_scope, keyed by mark name.
using expectations = std::map<std::string, expectation>;

// Returns "1 time" or "N times".
std::string describe_times(size_t count);

}  // namespace covmark
