#pragma once

#include <syslog.h>
#include <functional>
#include <string>

// Outputs a message to the current covmark log target.
void covmark_log(int priority, const char* format, ...) __attribute__ ((format (printf, 2, 3)));

// Sets the target for covmark logging messages.  Passing an empty
// function restores the default target chosen by log_init.
void set_covmark_logging_target(
    const std::function<void(int /* priority */, std::string /* message */)>&);

// log_init sets the covmark logging target to the given file descriptor, or to syslog if fd is -1.
// "name" should identify the current process.
// Debug-priority messages are dropped.
void log_init(const char* name, int fd);

#define COVLOG(format, ...) \
	covmark_log(LOG_INFO, format, ##__VA_ARGS__);

#define COVLOG_P(priority, format, ...) \
	covmark_log(priority, format, ##__VA_ARGS__);
