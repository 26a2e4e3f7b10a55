#include <cstdlib>
#include <filesystem>

#include <libconfig.h++>

#include "wisp/core/config.hpp"
#include "wisp/core/error.hpp"
#include "wisp/session.hpp"
#include "wisp/wayland/connection.hpp"
#include "log.hpp"

using namespace wisp;

int
main(int argc, char **argv) {
  std::filesystem::path path = "wisp.cfg";
  if (argc > 1) {
    path = argv[1];
  } else if (const char *env = getenv("WISP_CONFIG"); env) {
    path = env;
  }

  config_t config;
  try {
    config = config_t::load_from_file(path);
  } catch (const libconfig::ParseException &e) {
    CRITICAL("Failed to parse {}:{}: {}", path.string(), e.getLine(), e.getError());
    return 1;
  }

  // `WISP_LOG' wins over the configuration file.
  set_log_filter(parse_log_level(config.log_level).value_or(log_level::info));
  set_log_filter_from_env();

  INFO("Starting **{}**", config.window.toplevel.title);

  return run_guarded([&] {
    wayland_connection_t connection;
    session_t            session(connection, config.window);

    session.start();
    session.run();
  });
}
