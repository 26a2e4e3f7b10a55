#include "wisp/wayland/connection.hpp"

#include "../log.hpp"
#include "wl/xdg-decoration-unstable-v1-client-protocol.h"
#include "wl/xdg-shell-client-protocol.h"

#include <wayland-client-core.h>
#include <wayland-client-protocol.h>
#include <wayland-client.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <span>
#include <utility>

using namespace wisp;

namespace {
  object_t
  to_object(void *proxy) {
    return object_t{ reinterpret_cast<uintptr_t>(proxy) };
  }

  template<typename T>
  T *
  from_object(object_t object) {
    return reinterpret_cast<T *>(object.value);
  }

  wayland_connection_t *
  connection(void *data) {
    return reinterpret_cast<wayland_connection_t *>(data);
  }
}

// ---------------------------------------------------------------------
//  Listeners
// ---------------------------------------------------------------------

namespace {

  void
  handle_registry_global(void *data, wl_registry *, uint32_t name, const char *interface, uint32_t version) {
    connection(data)->deliver([&](event_handler_t &h) { h.on_global(name, interface, version); });
  }

  void
  handle_registry_global_remove(void *data, wl_registry *, uint32_t name) {
    connection(data)->deliver([&](event_handler_t &h) { h.on_global_remove(name); });
  }

  const struct wl_registry_listener wl_registry_listener_impl = {
    .global        = handle_registry_global,
    .global_remove = handle_registry_global_remove,
  };

  void
  handle_shm_format(void *data, wl_shm *shm, uint32_t format) {
    connection(data)->deliver([&](event_handler_t &h) { h.on_shm_format(to_object(shm), format); });
  }

  const struct wl_shm_listener wl_shm_listener_impl = { .format = handle_shm_format };

  void
  handle_wm_base_ping(void *data, xdg_wm_base *wm_base, uint32_t serial) {
    connection(data)->deliver([&](event_handler_t &h) { h.on_ping(to_object(wm_base), serial); });
  }

  const struct xdg_wm_base_listener xdg_wm_base_listener_impl = { .ping = handle_wm_base_ping };

  // wl_compositor is bound at v4, the v6 scale/transform events are
  // never sent to us.
  void
  handle_surface_enter(void *data, wl_surface *surface, wl_output *) {
    connection(data)->deliver(
      [&](event_handler_t &h) { h.on_unhandled(to_object(surface), "wl_surface.enter"); });
  }

  void
  handle_surface_leave(void *data, wl_surface *surface, wl_output *) {
    connection(data)->deliver(
      [&](event_handler_t &h) { h.on_unhandled(to_object(surface), "wl_surface.leave"); });
  }

  const struct wl_surface_listener wl_surface_listener_impl = {
    .enter = handle_surface_enter,
    .leave = handle_surface_leave,
  };

  void
  handle_xdg_surface_configure(void *data, xdg_surface *xdg, uint32_t serial) {
    connection(data)->deliver(
      [&](event_handler_t &h) { h.on_surface_configure(to_object(xdg), serial); });
  }

  const struct xdg_surface_listener xdg_surface_listener_impl = {
    .configure = handle_xdg_surface_configure,
  };

  void
  handle_toplevel_configure(void         *data,
                            xdg_toplevel *toplevel,
                            int32_t       width,
                            int32_t       height,
                            wl_array     *states) {
    std::span<const uint32_t> view(static_cast<const uint32_t *>(states->data),
                                   states->size / sizeof(uint32_t));
    connection(data)->deliver([&](event_handler_t &h) {
      h.on_toplevel_configure(to_object(toplevel), width, height, view);
    });
  }

  void
  handle_toplevel_close(void *data, xdg_toplevel *toplevel) {
    connection(data)->deliver(
      [&](event_handler_t &h) { h.on_toplevel_close(to_object(toplevel)); });
  }

  // xdg_wm_base is bound at v2 at most; configure_bounds (v4) and
  // wm_capabilities (v5) are never sent.
  const struct xdg_toplevel_listener xdg_toplevel_listener_impl = {
    .configure = handle_toplevel_configure,
    .close     = handle_toplevel_close,
  };

  void
  handle_decoration_configure(void                        *data,
                              zxdg_toplevel_decoration_v1 *decoration,
                              uint32_t                     mode) {
    connection(data)->deliver(
      [&](event_handler_t &h) { h.on_decoration_configure(to_object(decoration), mode); });
  }

  const struct zxdg_toplevel_decoration_v1_listener zxdg_toplevel_decoration_listener_impl = {
    .configure = handle_decoration_configure,
  };

  void
  handle_buffer_release(void *data, wl_buffer *buffer) {
    connection(data)->deliver([&](event_handler_t &h) { h.on_buffer_release(to_object(buffer)); });
  }

  const struct wl_buffer_listener wl_buffer_listener_impl = { .release = handle_buffer_release };
}

// ---------------------------------------------------------------------
//  wayland_connection_t
// ---------------------------------------------------------------------

namespace wisp {

  wayland_connection_t::wayland_connection_t(const char *name)
    : display_(wl_display_connect(name)) {
    if (!display_) {
      const char *display = name ? name : getenv("WAYLAND_DISPLAY");
      throw fatal_error_t(error_kind_t::eConnection,
                          phase_t::eConnect,
                          std::format("could not connect to Wayland display `{}': {}",
                                      display ? display : "wayland-0",
                                      strerror(errno)));
    }
    TRACE("Connected to Wayland display (fd {})", wl_display_get_fd(display_));
  }

  wayland_connection_t::wayland_connection_t(wl_display *display)
    : display_(display) {
    if (!display_) {
      throw fatal_error_t(
        error_kind_t::eConnection, phase_t::eConnect, "no Wayland display to adopt");
    }
  }

  wayland_connection_t::~wayland_connection_t() {
    // Local cleanup only, the server drops everything on disconnect.
    for (auto it = proxies_.rbegin(); it != proxies_.rend(); ++it)
      wl_proxy_destroy(*it);
    if (registry_)
      wl_registry_destroy(registry_);
    wl_display_disconnect(display_);
  }

  object_t
  wayland_connection_t::track(void *proxy, const char *what) {
    if (!proxy) {
      throw fatal_error_t(error_kind_t::eConnection,
                          phase_t::eDispatch,
                          std::format("libwayland failed to create {}", what));
    }
    proxies_.push_back(static_cast<wl_proxy *>(proxy));
    return to_object(proxy);
  }

  void
  wayland_connection_t::forget(object_t object) {
    auto it = std::find(proxies_.begin(), proxies_.end(), from_object<wl_proxy>(object));
    if (it != proxies_.end())
      proxies_.erase(it);
  }

  void
  wayland_connection_t::check(int ret, phase_t phase) {
    if (failure_) {
      auto failure = std::exchange(failure_, nullptr);
      std::rethrow_exception(failure);
    }

    if (ret >= 0)
      return;

    int         err = wl_display_get_error(display_);
    std::string message;
    if (err == EPROTO) {
      const wl_interface *interface = nullptr;
      uint32_t            id        = 0;
      uint32_t            code      = wl_display_get_protocol_error(display_, &interface, &id);
      message = std::format("protocol error {} on {}@{}", code, interface ? interface->name : "unknown", id);
    } else {
      message = std::format("display connection failed: {}", strerror(err ? err : errno));
    }
    throw fatal_error_t(error_kind_t::eConnection, phase, message);
  }

  void
  wayland_connection_t::set_handler(event_handler_t *handler) {
    handler_ = handler;
  }

  void
  wayland_connection_t::get_registry() {
    registry_ = wl_display_get_registry(display_);
    if (!registry_) {
      throw fatal_error_t(
        error_kind_t::eConnection, phase_t::eBinding, "libwayland failed to create wl_registry");
    }
    wl_registry_add_listener(registry_, &wl_registry_listener_impl, this);
  }

  void
  wayland_connection_t::roundtrip() {
    check(wl_display_roundtrip(display_), phase_t::eBinding);
  }

  void
  wayland_connection_t::dispatch() {
    check(wl_display_dispatch(display_), phase_t::eDispatch);
  }

  object_t
  wayland_connection_t::bind(uint32_t name, capability_t capability, uint32_t version) {
    switch (capability) {
      case capability_t::eCompositor: {
        return track(wl_registry_bind(registry_, name, &wl_compositor_interface, version),
                     "wl_compositor");
      }
      case capability_t::eShm: {
        auto shm = static_cast<wl_shm *>(wl_registry_bind(registry_, name, &wl_shm_interface, version));
        object_t object = track(shm, "wl_shm");
        wl_shm_add_listener(shm, &wl_shm_listener_impl, this);
        return object;
      }
      case capability_t::eWmBase: {
        auto wm_base =
          static_cast<xdg_wm_base *>(wl_registry_bind(registry_, name, &xdg_wm_base_interface, version));
        object_t object = track(wm_base, "xdg_wm_base");
        xdg_wm_base_add_listener(wm_base, &xdg_wm_base_listener_impl, this);
        return object;
      }
      case capability_t::eDecorationManager: {
        return track(
          wl_registry_bind(registry_, name, &zxdg_decoration_manager_v1_interface, version),
          "zxdg_decoration_manager_v1");
      }
    }
    throw fatal_error_t(error_kind_t::eMissingCapability, phase_t::eBinding, "unknown capability");
  }

  object_t
  wayland_connection_t::create_pool(object_t shm, int fd, int32_t size) {
    // libwayland dups the descriptor when marshalling; ours stays open
    // for as long as the region lives.
    return track(wl_shm_create_pool(from_object<wl_shm>(shm), fd, size), "wl_shm_pool");
  }

  object_t
  wayland_connection_t::create_buffer(object_t       pool,
                                      int32_t        offset,
                                      int32_t        width,
                                      int32_t        height,
                                      int32_t        stride,
                                      pixel_format_t format) {
    auto buffer = wl_shm_pool_create_buffer(from_object<wl_shm_pool>(pool),
                                            offset,
                                            width,
                                            height,
                                            stride,
                                            static_cast<uint32_t>(format));
    object_t object = track(buffer, "wl_buffer");
    wl_buffer_add_listener(buffer, &wl_buffer_listener_impl, this);
    return object;
  }

  void
  wayland_connection_t::destroy_buffer(object_t buffer) {
    forget(buffer);
    wl_buffer_destroy(from_object<wl_buffer>(buffer));
  }

  void
  wayland_connection_t::destroy_pool(object_t pool) {
    forget(pool);
    wl_shm_pool_destroy(from_object<wl_shm_pool>(pool));
  }

  void
  wayland_connection_t::pong(object_t wm_base, uint32_t serial) {
    xdg_wm_base_pong(from_object<xdg_wm_base>(wm_base), serial);
    // Answer now, not whenever the next request happens to flush.
    wl_display_flush(display_);
  }

  object_t
  wayland_connection_t::create_surface(object_t compositor) {
    auto     surface = wl_compositor_create_surface(from_object<wl_compositor>(compositor));
    object_t object  = track(surface, "wl_surface");
    wl_surface_add_listener(surface, &wl_surface_listener_impl, this);
    return object;
  }

  object_t
  wayland_connection_t::get_xdg_surface(object_t wm_base, object_t surface) {
    auto xdg =
      xdg_wm_base_get_xdg_surface(from_object<xdg_wm_base>(wm_base), from_object<wl_surface>(surface));
    object_t object = track(xdg, "xdg_surface");
    xdg_surface_add_listener(xdg, &xdg_surface_listener_impl, this);
    return object;
  }

  object_t
  wayland_connection_t::get_toplevel(object_t xdg) {
    auto     toplevel = xdg_surface_get_toplevel(from_object<xdg_surface>(xdg));
    object_t object   = track(toplevel, "xdg_toplevel");
    xdg_toplevel_add_listener(toplevel, &xdg_toplevel_listener_impl, this);
    return object;
  }

  void
  wayland_connection_t::set_title(object_t toplevel, const std::string &title) {
    xdg_toplevel_set_title(from_object<xdg_toplevel>(toplevel), title.c_str());
  }

  void
  wayland_connection_t::set_app_id(object_t toplevel, const std::string &app_id) {
    xdg_toplevel_set_app_id(from_object<xdg_toplevel>(toplevel), app_id.c_str());
  }

  void
  wayland_connection_t::ack_configure(object_t xdg, uint32_t serial) {
    xdg_surface_ack_configure(from_object<xdg_surface>(xdg), serial);
  }

  void
  wayland_connection_t::attach(object_t surface, object_t buffer, int32_t x, int32_t y) {
    wl_surface_attach(from_object<wl_surface>(surface), from_object<wl_buffer>(buffer), x, y);
  }

  void
  wayland_connection_t::damage(object_t surface, int32_t x, int32_t y, int32_t width, int32_t height) {
    wl_surface_damage(from_object<wl_surface>(surface), x, y, width, height);
  }

  void
  wayland_connection_t::commit(object_t surface) {
    wl_surface_commit(from_object<wl_surface>(surface));
  }

  object_t
  wayland_connection_t::get_toplevel_decoration(object_t manager, object_t toplevel) {
    auto decoration = zxdg_decoration_manager_v1_get_toplevel_decoration(
      from_object<zxdg_decoration_manager_v1>(manager), from_object<xdg_toplevel>(toplevel));
    object_t object = track(decoration, "zxdg_toplevel_decoration_v1");
    zxdg_toplevel_decoration_v1_add_listener(decoration, &zxdg_toplevel_decoration_listener_impl, this);
    return object;
  }

  void
  wayland_connection_t::set_decoration_mode(object_t decoration, decoration_mode_t mode) {
    zxdg_toplevel_decoration_v1_set_mode(from_object<zxdg_toplevel_decoration_v1>(decoration),
                                         static_cast<uint32_t>(mode));
  }
}
