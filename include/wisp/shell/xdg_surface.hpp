#pragma once

#include "wisp/core/error.hpp"
#include "wisp/core/protocol.hpp"
#include "wisp/core/shm_pool.hpp"
#include "wisp/core/signal.hpp"
#include "wisp/shell/xdg_decoration.hpp"
#include "wisp/shell/xdg_toplevel.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

/*
  Creating an xdg_surface from a wl_surface which has a buffer attached or
  committed is a client error, and any attempts by a client to attach or
  manipulate a buffer prior to the first xdg_surface.configure call must also
  be treated as errors.

  After creating a role-specific object and setting it up, the client must
  perform an initial commit without any buffer attached. The compositor will
  reply with an xdg_surface.configure event. The client must acknowledge it
  and is then allowed to attach a buffer to map the surface.
*/

namespace wisp {

  enum class handshake_state_t { eCreated, eAwaitingConfigure, eConfigured, eCommitted };

  const char *
  to_string(handshake_state_t);

  struct window_options_t {
    xdg_toplevel_data_t              toplevel;
    extent_t                         size{ 500, 500 };
    color_t                          color{ 0xff0000ff };
    pixel_format_t                   format{ pixel_format_t::eArgb8888 };
    std::optional<decoration_mode_t> decorations{ decoration_mode_t::eServerSide };
  };

  /**
   * @brief The window: `wl_surface' + `xdg_surface' + `xdg_toplevel',
   * and the configure handshake between them.
   *
   *   eCreated -> eAwaitingConfigure -> eConfigured -> eCommitted
   *                                          ^              |
   *                                          +--configure---+
   *
   * Content can only be presented with an `acked_configure_t', which can
   * only be obtained by acknowledging a `configure_t', which in turn is
   * only created when a configure event arrives.
   */
  class xdg_surface_t {
    public:
    class configure_t {
      uint32_t serial_;

      explicit configure_t(uint32_t serial)
        : serial_(serial) {}

      friend class xdg_surface_t;

      public:
      configure_t(configure_t &&)      = default;
      configure_t(const configure_t &) = delete;

      uint32_t
      serial() const {
        return serial_;
      }
    };

    class acked_configure_t {
      uint32_t serial_;

      explicit acked_configure_t(uint32_t serial)
        : serial_(serial) {}

      friend class xdg_surface_t;

      public:
      uint32_t
      serial() const {
        return serial_;
      }
    };

    struct {
      /// Emitted after the commit that answers a configure.
      signal_t<uint32_t> on_commit;
    } events;

    xdg_surface_t(shell_requests_t &requests, buffer_provisioner_t &provisioner, window_options_t options);
    ~xdg_surface_t();

    /**
     * @brief Create the surface and its roles, then perform the initial
     * commit without a buffer.
     *
     * The decoration object is only created when `decoration_manager' is
     * given and the options ask for a decoration mode.
     */
    void
    create(object_t compositor, object_t wm_base, std::optional<object_t> decoration_manager);

    /**
     * @brief `xdg_surface.configure': acknowledge `serial', then attach
     * a filled buffer and commit.
     *
     * Throws `fatal_error_t' (eProtocolSequence) if the roles were not created
     * yet.
     */
    event_outcome_t
    configure(uint32_t serial);

    /// `wl_buffer.release' for one of this window's buffers.
    event_outcome_t
    release(object_t buffer);

    bool
    owns_buffer(object_t buffer) const;

    handshake_state_t
    state() const {
      return state_;
    }

    object_t
    surface() const {
      return surface_;
    }

    object_t
    handle() const {
      return xdg_surface_;
    }

    xdg_toplevel_t *
    toplevel() {
      return toplevel_.get();
    }

    toplevel_decoration_t *
    decoration() {
      return decoration_.get();
    }

    /// The buffer currently attached to the surface, if any.
    const shm_buffer_t *
    attached() const {
      return current_.get();
    }

    /// Buffers still alive, including retired ones the server holds.
    size_t
    live_buffers() const {
      return (current_ ? 1 : 0) + retired_.size();
    }

    private:
    acked_configure_t
    ack(configure_t &&);

    void
    present(const acked_configure_t &);

    extent_t
    target_size() const;

    shm_buffer_t &
    acquire_buffer(extent_t size);

    shell_requests_t     &requests_;
    buffer_provisioner_t &provisioner_;
    window_options_t      options_;
    handshake_state_t     state_{ handshake_state_t::eCreated };

    object_t surface_, xdg_surface_;

    std::unique_ptr<xdg_toplevel_t>        toplevel_;
    std::unique_ptr<toplevel_decoration_t> decoration_;

    std::unique_ptr<shm_buffer_t>              current_;
    std::vector<std::unique_ptr<shm_buffer_t>> retired_;
  };
}
