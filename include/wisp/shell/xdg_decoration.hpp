#pragma once

#include "wisp/core/error.hpp"
#include "wisp/core/protocol.hpp"
#include "wisp/core/signal.hpp"

#include <optional>

namespace wisp {

  const char *
  to_string(decoration_mode_t);

  /**
   * @brief `zxdg_toplevel_decoration_v1' for the toplevel.
   *
   * The requested mode is only a preference; the compositor reports
   * the mode in effect through `configure'.  Nothing waits on it.
   */
  class toplevel_decoration_t {
    shell_requests_t                &requests_;
    object_t                         handle_;
    decoration_mode_t                requested_;
    std::optional<decoration_mode_t> current_;

    public:
    struct {
      signal_t<decoration_mode_t> on_mode;
    } events;

    toplevel_decoration_t(shell_requests_t &requests,
                          object_t          manager,
                          object_t          toplevel,
                          decoration_mode_t preferred);

    event_outcome_t
    configure(uint32_t mode);

    object_t
    handle() const {
      return handle_;
    }

    decoration_mode_t
    requested() const {
      return requested_;
    }

    std::optional<decoration_mode_t>
    current() const {
      return current_;
    }
  };
}
