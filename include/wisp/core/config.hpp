#pragma once

#include "wisp/shell/xdg_surface.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace wisp {

  struct config_t {
    window_options_t window;
    std::string      log_level = "info";

    static config_t
    load_from_file(const std::filesystem::path &);

    /// Throws `libconfig::ParseException' on malformed input.
    static config_t
    load_from_string(const std::string &);
  };

  /// Parses `#RRGGBB' (opaque) and `#AARRGGBB'.
  std::optional<color_t>
  parse_color(std::string_view);

  /// `server', `client' or `none'.  The outer optional is empty for
  /// unknown values, the inner one for `none'.
  std::optional<std::optional<decoration_mode_t>>
  parse_decorations(std::string_view);
}
