#include "core/log.h"

#include <stdarg.h>
#include <stdio.h>
#include <time.h>

#include <atomic>
#include <mutex>

namespace {

std::atomic<LogLevel> g_level {LogLevel::INFO};
std::atomic<LogSink> g_sink {nullptr};
std::mutex g_stderr_mutex;

void stderr_sink(LogLevel level, const char* tag, const char* msg) {
  char stamp[32];
  const time_t now = time(nullptr);
  struct tm local {};
  localtime_r(&now, &local);
  strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

  // Lines come from both the scheduler and the mosquitto network thread.
  std::lock_guard<std::mutex> lock(g_stderr_mutex);
  fprintf(stderr, "%s %-5s [%s] %s\n", stamp, Log::to_str(level), tag, msg);
}

} // namespace

void Log::set_level(LogLevel level) {
  g_level.store(level);
}

LogLevel Log::level() {
  return g_level.load();
}

void Log::set_sink(LogSink sink) {
  g_sink.store(sink);
}

void Log::logf(LogLevel level, const char* tag, const char* fmt, ...) {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(g_level.load())) return;
  if (!fmt) return;

  char msg[512];
  va_list ap;
  va_start(ap, fmt);
  vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);

  LogSink sink = g_sink.load();
  if (!sink) sink = &stderr_sink;
  sink(level, tag ? tag : "-", msg);
}

const char* Log::to_str(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default: return "INFO";
  }
}
