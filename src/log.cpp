#include "log.hpp"

#include <cstdlib>

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

void
set_log_filter_from_env() {
  const char *value = getenv("WISP_LOG");
  if (!value)
    return;

  if (auto level = parse_log_level(value); level) {
    set_log_filter(*level);
  } else {
    WARN("Ignoring unknown WISP_LOG level `{}'", value);
  }
}
