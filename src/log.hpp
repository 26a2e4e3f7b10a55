#pragma once

#include <cctype>
#include <cstring>
#include <format>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

enum class log_level { trace = 1, info, warn, error, critical };

inline log_level filter = log_level::info;

void
set_log_filter(log_level level);

log_level
get_log_filter();

/// Accepts `trace', `info', `warn', `error' and `critical'.
std::optional<log_level>
parse_log_level(std::string_view name);

/// Apply the `WISP_LOG' environment variable, if set and valid.
void
set_log_filter_from_env();

constexpr const char ANSI_RESET[]     = "\x1b[0m";
constexpr const char ANSI_BOLD[]      = "\x1b[1m";
constexpr const char ANSI_DIM[]       = "\x1b[2m";
constexpr const char ANSI_ITALIC[]    = "\x1b[3m";
constexpr const char ANSI_UNDERLINE[] = "\x1b[4m";

constexpr const char *
get_level_ansi_code(log_level level) {
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
get_level_text(log_level level) {
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

inline int
compute_string_length(std::string_view str) {
  int chars = 0;

  bool escape_code = false;
  for (char c : str) {
    if (c == '\x1b') {
      escape_code = true;
      continue;
    }

    if (escape_code && c == 'm') {
      escape_code = false;
      continue;
    }

    if (!escape_code && std::isprint(static_cast<unsigned char>(c))) {
      chars++;
    }
  }

  return chars;
}

// Replace `**', `__' and `//' marker pairs with ANSI codes
inline std::string
embed_ansi_codes(std::string str) {
  auto replace_marker = [&](const std::string &marker, const char *ansi_code) {
    size_t pos  = 0;
    bool   open = true;
    while ((pos = str.find(marker, pos)) != std::string::npos) {
      str.replace(pos, marker.size(), open ? ansi_code : ANSI_RESET);
      pos += std::strlen(open ? ansi_code : ANSI_RESET);
      open = !open;
    }
  };

  replace_marker("**", ANSI_BOLD);
  replace_marker("__", ANSI_UNDERLINE);
  replace_marker("//", ANSI_ITALIC);

  return str;
}

template<log_level Level, typename... Args>
void
print_log(const char *format_view, Args &...args) {
  if (static_cast<int>(filter) > static_cast<int>(Level))
    return;

  std::stringstream ss;
  ss << get_level_ansi_code(Level) << get_level_text(Level) << ": " << ANSI_RESET;

  std::string format_string = embed_ansi_codes(format_view);
  std::string log_message   = std::vformat(format_string, std::make_format_args(args...));

  // Continuation lines are indented under the message, with a fringe
  // pointing back at the level tag.
  int left_fringe = compute_string_length(ss.str());

  auto pos = log_message.find('\n');
  std::cerr << ss.str() << log_message.substr(0, pos) << "\n";

  while (pos != std::string::npos) {
    log_message.erase(0, pos + 1);
    pos = log_message.find('\n');

    std::cerr << std::string(left_fringe - 2, ' ');
    std::cerr << (pos == std::string::npos ? "╰ " : "├ ");
    std::cerr << log_message.substr(0, pos) << "\n";
  }
}

template<typename FormatString, typename... Args>
void
TRACE(FormatString message, Args... args) {
  print_log<log_level::trace, Args...>(message, args...);
}

template<typename FormatString, typename... Args>
void
INFO(FormatString message, Args... args) {
  print_log<log_level::info, Args...>(message, args...);
}

template<typename FormatString, typename... Args>
void
WARN(FormatString message, Args... args) {
  print_log<log_level::warn, Args...>(message, args...);
}

template<typename FormatString, typename... Args>
void
ERROR(FormatString message, Args... args) {
  print_log<log_level::error, Args...>(message, args...);
}

template<typename FormatString, typename... Args>
void
CRITICAL(FormatString message, Args... args) {
  print_log<log_level::critical, Args...>(message, args...);
}
