// Leveled stderr diagnostics: "<time> proctally: <LEVEL> <component>: <msg>"
#pragma once
#include <cstdarg>
#include <optional>
#include <string>
#include <string_view>

namespace proctally::util {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

// Parse DEBUG/INFO/WARNING/ERROR (case-insensitive, WARN accepted).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view s);
[[nodiscard]] const char* log_level_name(LogLevel lvl);

void set_log_level(LogLevel lvl);
[[nodiscard]] LogLevel log_level();
[[nodiscard]] bool log_enabled(LogLevel lvl);

// printf-style; component is a short tag such as "sampler" or "store".
// Lines below the current level are dropped before formatting.
void log_msg(LogLevel lvl, const char* component, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));
void vlog_msg(LogLevel lvl, const char* component, const char* fmt, va_list ap);

void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace proctally::util
