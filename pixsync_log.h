#pragma once
#include <stdarg.h>

// Logging shared by both endpoints.
// Default sink prints "[tag] message" lines to stderr. A host (or a test) can
// install its own sink; the sink is called with the already formatted text.

enum log_level { LOG_LVL_DEBUG=0, LOG_LVL_INFO=1, LOG_LVL_WARN=2, LOG_LVL_ERROR=3 };

typedef void (*sync_log_fn)(void *user, log_level lvl, const char *tag, const char *msg);

void sync_log_set_sink(sync_log_fn fn, void *user);
void sync_log_reset_sink();
void sync_log_set_level(log_level min_level);
log_level sync_log_level();

const char *log_level_name(log_level lvl);
bool log_level_from_string(const char *s, log_level *out);

void sync_log(log_level lvl, const char *tag, const char *fmt, ...)
#if defined(__GNUC__)
  __attribute__((format(printf, 3, 4)))
#endif
  ;
void sync_vlog(log_level lvl, const char *tag, const char *fmt, va_list ap);
