#pragma once

namespace cloudmux {

/// Enable or disable log_debug output.
void set_verbose(bool enabled);
bool verbose_enabled();

// printf-style helpers. Info and debug go to stdout, warnings and errors to stderr.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace cloudmux
