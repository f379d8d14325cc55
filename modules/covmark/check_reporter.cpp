#include "modules/covmark/check_reporter.h"
#include "modules/io/log.h"

#include <boost/format.hpp>

namespace covmark {

mark_failure mark_failure::make(const std::string& name, const expectation& expected,
                                size_t observed) {
  mark_failure result;
  result.name = name;
  result.expected = expected;
  result.observed = observed;
  if (observed == 0) {
    result.failure_kind = kind::never_hit;
  } else {
    result.failure_kind = kind::count_mismatch;
  }
  return result;
}

std::string mark_failure::describe() const {
  switch (failure_kind) {
    case kind::never_hit:
      return boost::str(boost::format("mark \"%s\" never hit (expected %s)") % name %
                        expected.describe());
    case kind::count_mismatch:
      return boost::str(boost::format("mark \"%s\" hit %s (expected %s)") % name %
                        describe_times(observed) % expected.describe());
  }
  return name;
}

std::string describe_failures(const std::vector<mark_failure>& failures) {
  std::string result = "Coverage mark check failed:";
  for (const auto& failure : failures) {
    result += "\n  ";
    result += failure.describe();
  }
  return result;
}

check_failure::check_failure(std::vector<mark_failure> failures)
    : std::runtime_error(describe_failures(failures)), m_failures(std::move(failures)) {}

void throwing_reporter::report_failures(const std::vector<mark_failure>& failures) {
  COVLOG_P(LOG_WARNING, "%s", describe_failures(failures).c_str());
  throw check_failure(failures);
}

}  // namespace covmark
