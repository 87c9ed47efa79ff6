#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>

// -----------------
//  Logging
// Messages are formatted with std::format and written to stderr,
// prefixed by a coloured level tag. `**bold**` and `__underline__`
// markers in the format string are turned into ANSI codes.
// -----------------

enum class log_level { trace = 1, info, warn, error, critical };

inline log_level filter = log_level::info;

void
set_log_filter(log_level level);
log_level
get_log_filter();

/// Accepts "trace", "info", "warn", "error" and "critical".
std::optional<log_level>
parse_log_level(std::string_view name);

/// Replace the `**` and `__` markers with the matching ANSI codes.
std::string
embed_ansi_codes(std::string format);

/// Write one (possibly multi-line) message; continuation lines are
/// indented under the level tag.
void
write_log(log_level level, std::string_view message);

template<log_level Level, typename... Args>
void
print_log(const char *format, Args &&...args) {
  if (static_cast<int>(filter) > static_cast<int>(Level))
    return;

  write_log(Level, std::vformat(embed_ansi_codes(format), std::make_format_args(args...)));
}

template<typename FormatString, typename... Args>
void
TRACE(FormatString message, Args... args) {
  print_log<log_level::trace, Args...>(message, std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void
INFO(FormatString message, Args... args) {
  print_log<log_level::info, Args...>(message, std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void
WARN(FormatString message, Args... args) {
  print_log<log_level::warn, Args...>(message, std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void
ERROR(FormatString message, Args... args) {
  print_log<log_level::error, Args...>(message, std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void
CRITICAL(FormatString message, Args... args) {
  print_log<log_level::critical, Args...>(message, std::forward<Args>(args)...);
}
