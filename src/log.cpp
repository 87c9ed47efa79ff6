#include "log.hpp"

#include <cctype>
#include <cstring>
#include <iostream>

namespace {
  constexpr const char ANSI_RESET[]     = "\x1b[0m";
  constexpr const char ANSI_BOLD[]      = "\x1b[1m";
  constexpr const char ANSI_UNDERLINE[] = "\x1b[4m";

  constexpr const char *
  level_color(log_level level) {
    switch (level) {
      case log_level::trace:
        return "\x1b[0;36m";
      case log_level::info:
        return "\x1b[0;32m";
      case log_level::warn:
        return "\x1b[0;33m";
      case log_level::error:
        return "\x1b[0;31m";
      case log_level::critical:
        return "\x1b[1;31m";
    }
    return ANSI_RESET;
  }

  constexpr const char *
  level_text(log_level level) {
    switch (level) {
      case log_level::trace:
        return "TRACE";
      case log_level::info:
        return "INFO";
      case log_level::warn:
        return "WARN";
      case log_level::error:
        return "ERROR";
      case log_level::critical:
        return "CRITICAL";
    }
    return "?";
  }
}

void
set_log_filter(log_level level) {
  filter = level;
}

log_level
get_log_filter() {
  return filter;
}

std::optional<log_level>
parse_log_level(std::string_view name) {
  if (name == "trace")
    return log_level::trace;
  if (name == "info")
    return log_level::info;
  if (name == "warn")
    return log_level::warn;
  if (name == "error")
    return log_level::error;
  if (name == "critical")
    return log_level::critical;
  return std::nullopt;
}

std::string
embed_ansi_codes(std::string format) {
  auto replace_marker = [&](std::string_view marker, const char *ansi_code) {
    size_t pos  = 0;
    bool   open = true;
    while ((pos = format.find(marker, pos)) != std::string::npos) {
      const char *code = open ? ansi_code : ANSI_RESET;
      format.replace(pos, marker.size(), code);
      pos += std::strlen(code);
      open = !open;
    }
  };

  replace_marker("**", ANSI_BOLD);
  replace_marker("__", ANSI_UNDERLINE);
  return format;
}

void
write_log(log_level level, std::string_view message) {
  std::string_view tag = level_text(level);
  std::cerr << level_color(level) << tag << ": " << ANSI_RESET;

  // "TAG: " minus the two columns taken by the fringe glyph.
  std::string indent(tag.size(), ' ');

  bool first = true;
  while (true) {
    auto pos  = message.find('\n');
    auto line = message.substr(0, pos);

    if (!first)
      std::cerr << indent << (pos == std::string_view::npos ? "╰ " : "├ ");
    std::cerr << line << "\n";

    if (pos == std::string_view::npos)
      break;
    message.remove_prefix(pos + 1);
    first = false;
  }
}
