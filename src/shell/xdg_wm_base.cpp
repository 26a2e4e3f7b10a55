#include "wisp/shell/xdg_wm_base.hpp"

#include "../log.hpp"

namespace wisp {

  xdg_wm_base_t::xdg_wm_base_t(shell_requests_t &requests, object_t handle)
    : requests_(requests)
    , handle_(handle) {}

  event_outcome_t
  xdg_wm_base_t::ping(uint32_t serial) {
    TRACE("xdg_wm_base::ping {}", serial);
    requests_.pong(handle_, serial);
    pongs_++;
    return event_outcome_t::eHandled;
  }
}
