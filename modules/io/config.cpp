#include "modules/io/config.h"

#include <boost/algorithm/string.hpp>
#include <cstdlib>

using boost::format;
using boost::str;

namespace {

int parse_int(const char* name, const std::string& value) {
  size_t pos = 0;
  int result = 0;
  try {
    result = std::stoi(value, &pos);
  } catch (const std::logic_error&) {
    throw config_exception(format("Environment variable %s has invalid integer value '%s'") %
                           name % value);
  }
  if (pos != value.size()) {
    throw config_exception(format("Environment variable %s has invalid integer value '%s'") %
                           name % value);
  }
  return result;
}

}  // namespace

const char* getenv_raw(const char* name) {
  const char* var = std::getenv(name);
  if (var == nullptr) {
    throw config_exception(str(format("Missing environment variable: %s") % name));
  }
  return var;
}

std::string getenv_str(const char* name) { return std::string(getenv_raw(name)); }

std::string getenv_str(const char* name, const std::string& default_value) {
  const char* var = std::getenv(name);
  if (var == nullptr) {
    return default_value;
  }
  return std::string(var);
}

int getenv_int(const char* name) { return parse_int(name, getenv_raw(name)); }

int getenv_int(const char* name, const int& default_value) {
  const char* var = std::getenv(name);
  if (var == nullptr) {
    return default_value;
  }
  return parse_int(name, var);
}

bool getenv_bool(const char* name, bool default_value) {
  const char* var = std::getenv(name);
  if (var == nullptr) {
    return default_value;
  }
  std::string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(var)));
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  throw config_exception(format("Environment variable %s has invalid boolean value '%s'") % name %
                         var);
}
