#pragma once
#include <stdint.h>

enum class LogLevel : uint8_t { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Receives every line at or above the configured level. msg is already formatted.
using LogSink = void (*)(LogLevel level, const char* tag, const char* msg);

namespace Log {

void set_level(LogLevel level);
LogLevel level();

// nullptr restores the default stderr sink.
void set_sink(LogSink sink);

void logf(LogLevel level, const char* tag, const char* fmt, ...)
  __attribute__((format(printf, 3, 4)));

const char* to_str(LogLevel level);

} // namespace Log

#ifndef LOG_TAG
#define LOG_TAG "main"
#endif

#define LOGD(...) ::Log::logf(LogLevel::DEBUG, LOG_TAG, __VA_ARGS__)
#define LOGI(...) ::Log::logf(LogLevel::INFO, LOG_TAG, __VA_ARGS__)
#define LOGW(...) ::Log::logf(LogLevel::WARN, LOG_TAG, __VA_ARGS__)
#define LOGE(...) ::Log::logf(LogLevel::ERROR, LOG_TAG, __VA_ARGS__)
