#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "modules/covmark/expectation.h"

namespace covmark {

// One mark that did not meet its expectation when a check_scope closed.
struct mark_failure {
  enum class kind {
    // Expected at least one hit, saw none.
    never_hit,
    // Expected an exact count, saw a different nonzero count, or saw
    // hits on a mark that must never be hit.
    count_mismatch,
  };

  kind failure_kind = kind::never_hit;
  std::string name;
  expectation expected;
  size_t observed = 0;

  // Classifies an unmet expectation.
  static mark_failure make(const std::string& name, const expectation& expected,
                           size_t observed);

  // e.g. 'mark "fast-path" never hit (expected at least once)'.
  std::string describe() const;
};

// Builds the diagnostic for a whole failed check, one line per mark.
std::string describe_failures(const std::vector<mark_failure>& failures);

// Raised when a check_scope closes with unmet expectations.
class check_failure : public std::runtime_error {
 public:
  explicit check_failure(std::vector<mark_failure> failures);

  const std::vector<mark_failure>& failures() const { return m_failures; }

 private:
  std::vector<mark_failure> m_failures;
};

// Turns unmet expectations into a test failure.  Usage faults, such as
// closing scopes out of order, do not go through the reporter; they are
// always fatal.
class check_reporter {
 public:
  virtual ~check_reporter() = default;

  // Called at most once per closed scope, with failures sorted by mark
  // name.  "failures" is never empty.
  virtual void report_failures(const std::vector<mark_failure>& failures) = 0;
};

// Default reporter: logs the diagnostic and throws check_failure.
class throwing_reporter : public check_reporter {
 public:
  void report_failures(const std::vector<mark_failure>& failures) override;
};

}  // namespace covmark
