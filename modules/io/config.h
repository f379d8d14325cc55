#pragma once

// Helpers for reading covmark settings from the environment.  covmark
// has no configuration file; everything that can be tuned at runtime
// is read from environment variables with these helpers.

#include <boost/format.hpp>

#include <stdexcept>
#include <string>

class config_exception : public std::runtime_error {
 public:
  config_exception(const std::string& message) : std::runtime_error(message) {}
  config_exception(const boost::format& formatted_message)
      : std::runtime_error(formatted_message.str()) {}

  std::string message() const { return what(); }
};

// The variants without a default throw config_exception if the
// variable is not set.  All variants throw config_exception if the
// value cannot be parsed.
const char* getenv_raw(const char* name);
std::string getenv_str(const char* name);
std::string getenv_str(const char* name, const std::string& default_value);
int getenv_int(const char* name);
int getenv_int(const char* name, const int& default_value);

// Accepts 1/0, true/false, yes/no and on/off, case insensitively.
bool getenv_bool(const char* name, bool default_value);
