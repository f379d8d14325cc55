#include "modules/io/log.h"
#include <stddef.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <time.h>
#include <limits.h>
#include <string.h>

#include <mutex>

static char log_name[256] = {0};
static int log_fd = -1;
static int log_level = LOG_DEBUG;

static std::mutex g_log_target_mutex;
static std::function<void(int, const std::string&)> g_log_output_function;

void set_covmark_logging_target(
    const std::function<void(int /* priority */, std::string /* message */)>& new_target) {
  std::lock_guard<std::mutex> l(g_log_target_mutex);
  if (new_target) {
    g_log_output_function = new_target;
  } else {
    g_log_output_function = nullptr;
  }
}

void covmark_log(int priority, const char* format, ...) {
	char log_buffer[PIPE_BUF] = {0};
	va_list args;
	va_start(args, format);
	std::function<void(int, const std::string&)> output_function;
	{
		std::lock_guard<std::mutex> l(g_log_target_mutex);
		output_function = g_log_output_function;
	}
	if (output_function) {
		char* buf;
		int len = vasprintf(&buf, format, args);
		if (len >= 0) {
			std::string stringified(buf, len);
			free(buf);
			output_function(priority, stringified);
		}
	} else if (log_fd >= 0 && priority <= log_level) {
		time_t t = time(NULL);
		char time_str[32] = {0};
		ctime_r(&t, time_str);
		// ctime_r terminates with a newline.
		time_str[strcspn(time_str, "\n")] = 0;
		int header = snprintf(log_buffer, PIPE_BUF, "%s %s[%d]: ", time_str, log_name, getpid());
		int rest = vsnprintf(log_buffer + header, PIPE_BUF - header, format, args);
		int total = header + rest;
		if (total >= PIPE_BUF) {
			total = PIPE_BUF - 1;
		}
		log_buffer[total++] = '\n';
		// Avoid pedantic warning
		if (write(log_fd, log_buffer, total) < 0) {}
	} else {
		vsyslog(priority, format, args);
	}
	va_end(args);
}

void log_init(const char* name, int fd)
{
	log_fd = fd;

	setlogmask(LOG_UPTO(LOG_INFO));
	log_level = LOG_INFO;

	if (getenv("COVMARK_LOG_STDERR")) {
		// Redirect all logging to standard error for
		// testing/debugging.
		log_fd = 2;
	}

	if (log_fd == -1) {
		// If no log file specified, log to syslog.
		int option = LOG_PID;
		openlog(name, option, LOG_LOCAL0);
	} else {
		if (name) {
			strncpy(log_name, name, 256);
			log_name[255] = 0;
		}
	}
}
