#include "wisp/core/error.hpp"

#include "../log.hpp"

#include <exception>

namespace wisp {

  int
  run_guarded(const std::function<void()> &body) {
    try {
      body();
    } catch (const fatal_error_t &e) {
      CRITICAL("{} phase failed ({}): {}", to_string(e.phase()), to_string(e.kind()), e.what());
      return 1;
    } catch (const std::exception &e) {
      CRITICAL("Unexpected failure: {}", e.what());
      return 1;
    }
    return 0;
  }
}
