#pragma once

#include "wisp/core/config.hpp"
#include "wisp/core/protocol.hpp"
#include "wisp/core/registry.hpp"
#include "wisp/core/shm_pool.hpp"
#include "wisp/shell/xdg_surface.hpp"
#include "wisp/shell/xdg_wm_base.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace wisp {

  /**
   * @brief Owns the components of a single-window client and routes
   * every inbound event to the one owning the source object.
   *
   * Any error thrown by a handler ends the session; nothing is retried.
   */
  class session_t : public event_handler_t {
    public:
    session_t(connection_t &connection, window_options_t options);
    ~session_t();

    session_t(const session_t &) = delete;
    session_t &
    operator=(const session_t &) = delete;

    /**
     * @brief Discover and bind globals, then create the window.
     *
     * Performs two roundtrips: the first collects the globals, the
     * second guarantees every bind was processed before any bound
     * object is used.
     */
    void
    start();

    /// Block until events are available and dispatch them.
    void
    dispatch_once();

    /// Dispatch forever.  Only returns by throwing.
    [[noreturn]] void
    run();

    registry_t &
    registry() {
      return registry_;
    }

    xdg_surface_t *
    window() {
      return window_.get();
    }

    xdg_wm_base_t *
    wm_base() {
      return wm_base_ ? &*wm_base_ : nullptr;
    }

    /// Events that reached a handler without a policy for them.
    size_t
    unhandled_events() const {
      return unhandled_;
    }

    // event_handler_t
    event_outcome_t
    on_global(uint32_t name, std::string_view interface, uint32_t version) override;

    event_outcome_t
    on_global_remove(uint32_t name) override;

    event_outcome_t
    on_shm_format(object_t shm, uint32_t format) override;

    event_outcome_t
    on_ping(object_t wm_base, uint32_t serial) override;

    event_outcome_t
    on_surface_configure(object_t xdg_surface, uint32_t serial) override;

    event_outcome_t
    on_toplevel_configure(object_t                  toplevel,
                          int32_t                   width,
                          int32_t                   height,
                          std::span<const uint32_t> states) override;

    event_outcome_t
    on_toplevel_close(object_t toplevel) override;

    event_outcome_t
    on_decoration_configure(object_t decoration, uint32_t mode) override;

    event_outcome_t
    on_buffer_release(object_t buffer) override;

    event_outcome_t
    on_unhandled(object_t source, std::string_view event) override;

    private:
    event_outcome_t
    account(event_outcome_t outcome, std::string_view event);

    [[noreturn]] void
    unexpected(std::string_view event, object_t source) const;

    connection_t                       &connection_;
    window_options_t                    options_;
    registry_t                          registry_;
    std::optional<buffer_provisioner_t> provisioner_;
    std::optional<xdg_wm_base_t>        wm_base_;
    std::unique_ptr<xdg_surface_t>      window_;
    size_t                              unhandled_{ 0 };
  };
}
