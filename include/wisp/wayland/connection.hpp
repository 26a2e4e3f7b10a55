#pragma once

#include "wisp/core/protocol.hpp"

#include <exception>
#include <string>
#include <vector>

struct wl_display;
struct wl_registry;
struct wl_proxy;

namespace wisp {

  /**
   * @brief `connection_t' on top of libwayland-client.
   *
   * Handles are `wl_proxy' addresses.  Every proxy gets a listener whose
   * user data is this connection; the listeners forward to the installed
   * `event_handler_t'.
   *
   * Listeners are called from C.  An exception thrown by the handler is
   * stored, later events of the same batch are dropped, and the
   * exception is rethrown once `dispatch' or `roundtrip' returns.
   */
  class wayland_connection_t : public connection_t {
    wl_display             *display_;
    wl_registry            *registry_{ nullptr };
    event_handler_t        *handler_{ nullptr };
    std::exception_ptr      failure_;
    std::vector<wl_proxy *> proxies_;

    public:
    /// Connect to `name', or to `$WAYLAND_DISPLAY' when null.  Throws
    /// `fatal_error_t' (eConnection) when no display server is reachable.
    explicit wayland_connection_t(const char *name = nullptr);

    /// Adopt an already connected display, e.g. one from
    /// `wl_display_connect_to_fd'.  Takes ownership.
    explicit wayland_connection_t(wl_display *display);
    ~wayland_connection_t();

    wayland_connection_t(const wayland_connection_t &) = delete;
    wayland_connection_t &
    operator=(const wayland_connection_t &) = delete;

    wl_display *
    display() {
      return display_;
    }

    /// Invoke `fn' on the handler, unless a previous event failed.
    template<typename Fn>
    void
    deliver(Fn &&fn) {
      if (!handler_ || failure_)
        return;
      try {
        fn(*handler_);
      } catch (...) {
        failure_ = std::current_exception();
      }
    }

    // transport_t
    void
    set_handler(event_handler_t *handler) override;

    void
    get_registry() override;

    void
    roundtrip() override;

    void
    dispatch() override;

    // registry_requests_t
    object_t
    bind(uint32_t name, capability_t capability, uint32_t version) override;

    // shm_requests_t
    object_t
    create_pool(object_t shm, int fd, int32_t size) override;

    object_t
    create_buffer(object_t       pool,
                  int32_t        offset,
                  int32_t        width,
                  int32_t        height,
                  int32_t        stride,
                  pixel_format_t format) override;

    void
    destroy_buffer(object_t buffer) override;

    void
    destroy_pool(object_t pool) override;

    // shell_requests_t
    void
    pong(object_t wm_base, uint32_t serial) override;

    object_t
    create_surface(object_t compositor) override;

    object_t
    get_xdg_surface(object_t wm_base, object_t surface) override;

    object_t
    get_toplevel(object_t xdg_surface) override;

    void
    set_title(object_t toplevel, const std::string &title) override;

    void
    set_app_id(object_t toplevel, const std::string &app_id) override;

    void
    ack_configure(object_t xdg_surface, uint32_t serial) override;

    void
    attach(object_t surface, object_t buffer, int32_t x, int32_t y) override;

    void
    damage(object_t surface, int32_t x, int32_t y, int32_t width, int32_t height) override;

    void
    commit(object_t surface) override;

    object_t
    get_toplevel_decoration(object_t manager, object_t toplevel) override;

    void
    set_decoration_mode(object_t decoration, decoration_mode_t mode) override;

    private:
    object_t
    track(void *proxy, const char *what);

    void
    forget(object_t);

    void
    check(int ret, phase_t phase);
  };
}
