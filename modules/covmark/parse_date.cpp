#include "modules/covmark/parse_date.h"
#include "modules/covmark/covmark.h"

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <ostream>

namespace {

bool is_canonical(const std::string& s) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
    return false;
  }
  for (size_t i = 0; i < s.size(); ++i) {
    if (i == 4 || i == 7) {
      continue;
    }
    if (s[i] < '0' || s[i] > '9') {
      return false;
    }
  }
  return true;
}

unsigned digits(const std::string& s, size_t pos, size_t len) {
  unsigned result = 0;
  for (size_t i = pos; i < pos + len; ++i) {
    result = result * 10 + (s[i] - '0');
  }
  return result;
}

boost::optional<calendar_date> from_canonical(const std::string& s) {
  calendar_date date;
  date.year = digits(s, 0, 4);
  date.month = digits(s, 5, 2);
  date.day = digits(s, 8, 2);
  if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
    COVMARK_HIT("date out of range");
    return boost::none;
  }
  return date;
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const calendar_date& date) {
  return os << boost::format("%04d-%02d-%02d") % date.year % date.month % date.day;
}

boost::optional<calendar_date> parse_date(const std::string& s) {
  if (is_canonical(s)) {
    COVMARK_HIT("fast-path");
    return from_canonical(s);
  }

  COVMARK_HIT("slow-path");
  std::string normalized = boost::algorithm::trim_copy(s);
  boost::algorithm::replace_all(normalized, "/", "-");
  COVMARK_HIT_IF("trimmed whitespace", normalized.size() != s.size());

  if (normalized.size() != 10) {
    COVMARK_HIT("short date");
    return boost::none;
  }
  if (normalized[4] != '-' || normalized[7] != '-') {
    COVMARK_HIT("wrong dashes");
    return boost::none;
  }
  if (!is_canonical(normalized)) {
    COVMARK_HIT("non-digit in date");
    return boost::none;
  }
  return from_canonical(normalized);
}
