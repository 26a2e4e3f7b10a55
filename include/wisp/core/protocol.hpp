#pragma once

#include "wisp/core/error.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \defgroup Protocol seam
 *
 * The components never talk to libwayland directly. They issue requests
 * through the narrow interfaces below, and receive events through
 * `event_handler_t'. `wayland_connection_t' implements all of them on
 * top of libwayland-client; the tests implement them with a recorder.
 */

namespace wisp {

  /**
   * @brief Opaque client-side handle to a protocol object.
   *
   * For the libwayland connection this is the `wl_proxy' address, for
   * other implementations any non-zero identity works.
   */
  struct object_t {
    uintptr_t value{ 0 };

    explicit
    operator bool() const {
      return value != 0;
    }

    bool
    operator==(const object_t &) const = default;
  };

  enum class capability_t : uint8_t { eCompositor, eShm, eWmBase, eDecorationManager };

  /// Values match `enum wl_shm_format'.
  enum class pixel_format_t : uint32_t { eArgb8888 = 0, eXrgb8888 = 1 };

  /// Values match `enum zxdg_toplevel_decoration_v1_mode'.
  enum class decoration_mode_t : uint32_t { eClientSide = 1, eServerSide = 2 };

  class registry_requests_t {
    public:
    virtual ~registry_requests_t() = default;

    virtual object_t
    bind(uint32_t name, capability_t capability, uint32_t version) = 0;
  };

  class shm_requests_t {
    public:
    virtual ~shm_requests_t() = default;

    virtual object_t
    create_pool(object_t shm, int fd, int32_t size) = 0;

    virtual object_t
    create_buffer(object_t       pool,
                  int32_t        offset,
                  int32_t        width,
                  int32_t        height,
                  int32_t        stride,
                  pixel_format_t format) = 0;

    virtual void
    destroy_buffer(object_t buffer) = 0;

    virtual void
    destroy_pool(object_t pool) = 0;
  };

  class shell_requests_t {
    public:
    virtual ~shell_requests_t() = default;

    virtual void
    pong(object_t wm_base, uint32_t serial) = 0;

    virtual object_t
    create_surface(object_t compositor) = 0;

    virtual object_t
    get_xdg_surface(object_t wm_base, object_t surface) = 0;

    virtual object_t
    get_toplevel(object_t xdg_surface) = 0;

    virtual void
    set_title(object_t toplevel, const std::string &title) = 0;

    virtual void
    set_app_id(object_t toplevel, const std::string &app_id) = 0;

    virtual void
    ack_configure(object_t xdg_surface, uint32_t serial) = 0;

    virtual void
    attach(object_t surface, object_t buffer, int32_t x, int32_t y) = 0;

    virtual void
    damage(object_t surface, int32_t x, int32_t y, int32_t width, int32_t height) = 0;

    virtual void
    commit(object_t surface) = 0;

    virtual object_t
    get_toplevel_decoration(object_t manager, object_t toplevel) = 0;

    virtual void
    set_decoration_mode(object_t decoration, decoration_mode_t mode) = 0;
  };

  /// Inbound events, routed by the session to the owning component.
  class event_handler_t {
    public:
    virtual ~event_handler_t() = default;

    virtual event_outcome_t
    on_global(uint32_t name, std::string_view interface, uint32_t version) = 0;

    virtual event_outcome_t
    on_global_remove(uint32_t name) = 0;

    virtual event_outcome_t
    on_shm_format(object_t shm, uint32_t format) = 0;

    virtual event_outcome_t
    on_ping(object_t wm_base, uint32_t serial) = 0;

    virtual event_outcome_t
    on_surface_configure(object_t xdg_surface, uint32_t serial) = 0;

    virtual event_outcome_t
    on_toplevel_configure(object_t                  toplevel,
                          int32_t                   width,
                          int32_t                   height,
                          std::span<const uint32_t> states) = 0;

    virtual event_outcome_t
    on_toplevel_close(object_t toplevel) = 0;

    virtual event_outcome_t
    on_decoration_configure(object_t decoration, uint32_t mode) = 0;

    virtual event_outcome_t
    on_buffer_release(object_t buffer) = 0;

    /// Events the protocol defines but this client has no handler for,
    /// e.g. `wl_surface.enter'.
    virtual event_outcome_t
    on_unhandled(object_t source, std::string_view event) = 0;
  };

  class transport_t {
    public:
    virtual ~transport_t() = default;

    /// Route all inbound events to `handler'.
    virtual void
    set_handler(event_handler_t *handler) = 0;

    /// Request the registry object; globals arrive as `on_global'.
    virtual void
    get_registry() = 0;

    /// Block until the server processed every request sent so far, and
    /// all events it sent in response were dispatched.
    virtual void
    roundtrip() = 0;

    /// Block until at least one event is available, then dispatch all
    /// pending events.
    virtual void
    dispatch() = 0;
  };

  /// Everything the session needs from a live display connection.
  class connection_t
    : public transport_t
    , public registry_requests_t
    , public shm_requests_t
    , public shell_requests_t {};
}
