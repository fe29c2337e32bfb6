#pragma once

namespace gigvault {

/// Enable or disable log_debug() output (off by default).
void set_verbose_logging(bool enabled);
bool verbose_logging();

/// printf-style logging with an ISO-8601 UTC timestamp prefix.
/// info/debug go to stdout, warn/error to stderr; every line is flushed.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace gigvault
