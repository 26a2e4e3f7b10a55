#pragma once

#include "wisp/core/error.hpp"
#include "wisp/core/protocol.hpp"
#include "wisp/core/signal.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace wisp {

  struct xdg_toplevel_data_t {
    std::string title, app_id;
  };

  struct extent_t {
    int32_t width, height;

    bool
    operator==(const extent_t &) const = default;
  };

  /// Values match `enum xdg_toplevel_state'.
  enum class toplevel_state_t : uint32_t {
    eMaximized = 1,
    eFullscreen,
    eResizing,
    eActivated,
    eTiledLeft,
    eTiledRight,
    eTiledTop,
    eTiledBottom,
    eSuspended,
  };

  const char *
  to_string(toplevel_state_t);

  class xdg_toplevel_t {
    shell_requests_t     &requests_;
    object_t              handle_;
    xdg_toplevel_data_t   data_;
    std::optional<extent_t> suggested_;
    std::vector<uint32_t> states_;

    public:
    struct {
      signal_t<> on_close;
    } events;

    /// Sends `set_title' and `set_app_id' (when not empty) for `handle'.
    xdg_toplevel_t(shell_requests_t &requests, object_t handle, const xdg_toplevel_data_t &data);

    /**
     * @brief `xdg_toplevel.configure'.
     *
     * A non-zero size is remembered and used by the next
     * `xdg_surface.configure'; zero leaves the size to the client.
     * Window states are recorded, but this client has no policy for
     * them and reports the event as `eUnhandled' when any are set.
     */
    event_outcome_t
    configure(int32_t width, int32_t height, std::span<const uint32_t> states);

    /// `xdg_toplevel.close'; there is no teardown path, so unhandled.
    event_outcome_t
    close();

    object_t
    handle() const {
      return handle_;
    }

    const xdg_toplevel_data_t &
    data() const {
      return data_;
    }

    std::optional<extent_t>
    suggested_size() const {
      return suggested_;
    }

    const std::vector<uint32_t> &
    states() const {
      return states_;
    }
  };
}
