#pragma once

namespace glacierup {

/// printf-style logging. Info and debug go to stdout, warnings and errors to
/// stderr. Each call writes one line and flushes.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Only emitted after set_verbose(true).
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose(bool verbose);
bool is_verbose();

} // namespace glacierup
