#pragma once

#include <iosfwd>
#include <string>

#include <boost/optional.hpp>

// A small instrumented parser used to exercise coverage marks end to
// end.  Accepts "YYYY-MM-DD"; the slow path also trims surrounding
// whitespace and accepts '/' as a separator.
struct calendar_date {
  unsigned year = 0;
  unsigned month = 0;
  unsigned day = 0;

  bool operator==(const calendar_date& rhs) const {
    return year == rhs.year && month == rhs.month && day == rhs.day;
  }
};

std::ostream& operator<<(std::ostream& os, const calendar_date& date);

boost::optional<calendar_date> parse_date(const std::string& s);
