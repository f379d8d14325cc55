#include "modules/covmark/expectation.h"

#include <boost/format.hpp>

namespace covmark {

std::string describe_times(size_t count) {
  if (count == 1) {
    return "1 time";
  }
  return boost::str(boost::format("%d times") % count);
}

std::string expectation::describe() const {
  if (m_mode == mode::at_least_once) {
    return "at least once";
  }
  if (m_count == 0) {
    return "never";
  }
  return "exactly " + describe_times(m_count);
}

}  // namespace covmark
