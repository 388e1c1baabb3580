#pragma once
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

enum LogLevel {
  RLOG_FATAL = 0,
  RLOG_ERROR,
  RLOG_WARN,
  RLOG_INFO,
  RLOG_DEBUG,
  RLOG_VERBOSE,
};

namespace relaylog {

inline std::atomic<int> & level() {
  static std::atomic<int> lvl(RLOG_INFO);
  return lvl;
}

inline void setLogDebugLevel(const int lvl) {
  level().store(lvl);
}

inline bool enabled(const int lvl) {
  return lvl <= level().load();
}

/**
 * @brief parse "fatal", "error", "warn", "info", "debug" or "verbose".
 * @return the level, or -1 if the name is unknown
 */
inline int ParseLevel(const char* name) {
  static const char* names[] = {"fatal", "error", "warn", "info", "debug", "verbose"};
  for (int i = RLOG_FATAL; i <= RLOG_VERBOSE; i++) {
    if (std::strcmp(name, names[i]) == 0) return i;
  }
  return -1;
}

inline void log(const int lvl, const char* file, const int line, const char* fmt, ...)
    __attribute__((format(printf, 4, 5)));

inline void log(const int lvl, const char* file, const int line, const char* fmt, ...) {
  static const char* tags[] = {"FATAL", "ERROR", "WARN ", "INFO ", "DEBUG", "VERB "};
  static std::mutex out_latch;
  if (!enabled(lvl)) return;

  char time_buf[32];
  std::time_t now = std::time(nullptr);
  std::tm tm_now;
  localtime_r(&now, &tm_now);
  std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_now);

  const char* base = std::strrchr(file, '/');
  base = (base == nullptr) ? file : base + 1;

  std::lock_guard<std::mutex> guard(out_latch);
  std::fprintf(stderr, "[%s %s %s:%d] ", tags[lvl], time_buf, base, line);
  va_list args;
  va_start(args, fmt);
  std::vfprintf(stderr, fmt, args);
  va_end(args);
  std::fputc('\n', stderr);
}

}  // namespace relaylog

#define LOG_FATAL(...)   relaylog::log(RLOG_FATAL,   __FILE__, __LINE__, __VA_ARGS__)
#define LOG_ERROR(...)   relaylog::log(RLOG_ERROR,   __FILE__, __LINE__, __VA_ARGS__)
#define LOG_WARN(...)    relaylog::log(RLOG_WARN,    __FILE__, __LINE__, __VA_ARGS__)
#define LOG_INFO(...)    relaylog::log(RLOG_INFO,    __FILE__, __LINE__, __VA_ARGS__)
#define LOG_DEBUG(...)   relaylog::log(RLOG_DEBUG,   __FILE__, __LINE__, __VA_ARGS__)
#define LOG_VERBOSE(...) relaylog::log(RLOG_VERBOSE, __FILE__, __LINE__, __VA_ARGS__)
