#include "pixsync_log.h"
#include <stdio.h>
#include <string.h>
#include <mutex>

static std::mutex g_log_mtx;
static sync_log_fn g_sink = nullptr;
static void *g_sink_user = nullptr;
static log_level g_min_level = LOG_LVL_INFO;

void sync_log_set_sink(sync_log_fn fn, void *user) {
  std::lock_guard<std::mutex> lk(g_log_mtx);
  g_sink = fn;
  g_sink_user = user;
}

void sync_log_reset_sink() { sync_log_set_sink(nullptr, nullptr); }

void sync_log_set_level(log_level min_level) {
  std::lock_guard<std::mutex> lk(g_log_mtx);
  g_min_level = min_level;
}

log_level sync_log_level() {
  std::lock_guard<std::mutex> lk(g_log_mtx);
  return g_min_level;
}

const char *log_level_name(log_level lvl) {
  switch (lvl) {
    case LOG_LVL_DEBUG: return "debug";
    case LOG_LVL_INFO:  return "info";
    case LOG_LVL_WARN:  return "warn";
    case LOG_LVL_ERROR: return "error";
    default:            return "info";
  }
}

bool log_level_from_string(const char *s, log_level *out) {
  if (!s || !out) return false;
  if (strcmp(s, "debug") == 0) { *out = LOG_LVL_DEBUG; return true; }
  if (strcmp(s, "info") == 0)  { *out = LOG_LVL_INFO;  return true; }
  if (strcmp(s, "warn") == 0)  { *out = LOG_LVL_WARN;  return true; }
  if (strcmp(s, "error") == 0) { *out = LOG_LVL_ERROR; return true; }
  return false;
}

void sync_vlog(log_level lvl, const char *tag, const char *fmt, va_list ap) {
  char buf[1024];
  vsnprintf(buf, sizeof(buf), fmt, ap);

  sync_log_fn fn;
  void *user;
  {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (lvl < g_min_level) return;
    fn = g_sink;
    user = g_sink_user;
  }
  if (fn) {
    fn(user, lvl, tag ? tag : "", buf);
    return;
  }
  if (lvl >= LOG_LVL_WARN) fprintf(stderr, "[%s] %s: %s\n", tag ? tag : "", log_level_name(lvl), buf);
  else fprintf(stderr, "[%s] %s\n", tag ? tag : "", buf);
}

void sync_log(log_level lvl, const char *tag, const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  sync_vlog(lvl, tag, fmt, ap);
  va_end(ap);
}
