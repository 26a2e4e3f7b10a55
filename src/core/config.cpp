#include "wisp/core/config.hpp"

#include <charconv>
#include <fstream>
#include <libconfig.h++>
#include <sstream>

#include "../log.hpp"

namespace wisp {

  std::optional<color_t>
  parse_color(std::string_view text) {
    if (text.empty() || text.front() != '#')
      return std::nullopt;
    text.remove_prefix(1);
    if (text.size() != 6 && text.size() != 8)
      return std::nullopt;

    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (ec != std::errc{} || ptr != text.data() + text.size())
      return std::nullopt;

    if (text.size() == 6)
      value |= 0xff000000;
    return color_t{ value };
  }

  std::optional<std::optional<decoration_mode_t>>
  parse_decorations(std::string_view text) {
    if (text == "server")
      return std::make_optional(std::optional{ decoration_mode_t::eServerSide });
    if (text == "client")
      return std::make_optional(std::optional{ decoration_mode_t::eClientSide });
    if (text == "none")
      return std::make_optional(std::optional<decoration_mode_t>{});
    return std::nullopt;
  }

  static void
  parse_window_group(const libconfig::Setting &setting, window_options_t &opt) {
    setting.lookupValue("title", opt.toplevel.title);
    setting.lookupValue("app_id", opt.toplevel.app_id);

    int width = opt.size.width, height = opt.size.height;
    setting.lookupValue("width", width);
    setting.lookupValue("height", height);
    if (width > 0 && height > 0) {
      opt.size = { width, height };
    } else {
      WARN("Ignoring window size {}x{}, keeping {}x{}", width, height, opt.size.width, opt.size.height);
    }

    std::string color;
    if (setting.lookupValue("color", color)) {
      if (auto parsed = parse_color(color); parsed) {
        opt.color = *parsed;
      } else {
        WARN("Ignoring window color `{}', expected #RRGGBB or #AARRGGBB", color);
      }
    }

    std::string decorations;
    if (setting.lookupValue("decorations", decorations)) {
      if (auto parsed = parse_decorations(decorations); parsed) {
        opt.decorations = *parsed;
      } else {
        WARN("Ignoring decorations `{}', expected server, client or none", decorations);
      }
    }
  }

  config_t
  config_t::load_from_string(const std::string &source) {
    libconfig::Config config;
    config_t          cfg;
    cfg.window.toplevel = { .title = "Hello, world!", .app_id = "wisp" };

    config.readString(source);

    if (config.exists("window")) {
      auto &window = config.lookup("window");
      if (window.isGroup()) {
        parse_window_group(window, cfg.window);
      } else {
        WARN("`window' is not a group, using defaults");
      }
    }

    std::string level;
    if (config.lookupValue("log.level", level)) {
      if (parse_log_level(level)) {
        cfg.log_level = level;
      } else {
        WARN("Ignoring log level `{}'", level);
      }
    }

    return cfg;
  }

  config_t
  config_t::load_from_file(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file) {
      INFO("No configuration at {}, using defaults", path.string());
      return load_from_string("");
    }

    std::stringstream ss;
    ss << file.rdbuf();

    return load_from_string(ss.str());
  }
}
