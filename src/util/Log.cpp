#include "util/Log.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace proctally::util {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_write_mu;

std::optional<LogLevel> parse_log_level(std::string_view s) {
  std::string up; up.reserve(s.size());
  for (char c : s) up.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  if (up == "DEBUG") return LogLevel::Debug;
  if (up == "INFO") return LogLevel::Info;
  if (up == "WARNING" || up == "WARN") return LogLevel::Warning;
  if (up == "ERROR") return LogLevel::Error;
  return std::nullopt;
}

const char* log_level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

void set_log_level(LogLevel lvl) { g_level.store(static_cast<int>(lvl)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

bool log_enabled(LogLevel lvl) { return static_cast<int>(lvl) >= g_level.load(); }

void vlog_msg(LogLevel lvl, const char* component, const char* fmt, va_list ap) {
  if (!log_enabled(lvl)) return;

  auto now = std::chrono::system_clock::now();
  auto now_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  ::localtime_r(&now_t, &tm);
  char ts[32];
  std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d,%03d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));

  char body[1024];
  std::vsnprintf(body, sizeof(body), fmt, ap);

  std::lock_guard<std::mutex> lk(g_write_mu);
  std::fprintf(stderr, "%s proctally: %s %s: %s\n", ts, log_level_name(lvl), component, body);
}

void log_msg(LogLevel lvl, const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog_msg(lvl, component, fmt, ap);
  va_end(ap);
}

void log_debug(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog_msg(LogLevel::Debug, component, fmt, ap);
  va_end(ap);
}

void log_info(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog_msg(LogLevel::Info, component, fmt, ap);
  va_end(ap);
}

void log_warn(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog_msg(LogLevel::Warning, component, fmt, ap);
  va_end(ap);
}

void log_error(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog_msg(LogLevel::Error, component, fmt, ap);
  va_end(ap);
}

} // namespace proctally::util
