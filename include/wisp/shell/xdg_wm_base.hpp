#pragma once

#include "wisp/core/error.hpp"
#include "wisp/core/protocol.hpp"

#include <cstdint>

namespace wisp {

  /**
   * @brief Client side of `xdg_wm_base'.
   *
   * Answers liveness checks.  A `ping' is answered with a matching
   * `pong' right away, whatever state the window is in; a client that
   * does not answer in time is considered hung by the compositor.
   */
  class xdg_wm_base_t {
    shell_requests_t &requests_;
    object_t          handle_;
    uint32_t          pongs_{ 0 };

    public:
    xdg_wm_base_t(shell_requests_t &requests, object_t handle);

    event_outcome_t
    ping(uint32_t serial);

    object_t
    handle() const {
      return handle_;
    }

    uint32_t
    pongs_sent() const {
      return pongs_;
    }
  };
}
