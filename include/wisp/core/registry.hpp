#pragma once

#include "wisp/core/error.hpp"
#include "wisp/core/protocol.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wisp {

  struct global_t {
    uint32_t    name;
    std::string interface;
    uint32_t    version;
  };

  /// Static description of a capability this client understands.
  struct capability_info_t {
    capability_t     capability;
    std::string_view interface;
    uint32_t         max_version;
    bool             required;
  };

  inline constexpr std::array<capability_info_t, 4> CAPABILITIES = { {
    { capability_t::eCompositor, "wl_compositor", 4, true },
    { capability_t::eShm, "wl_shm", 1, true },
    { capability_t::eWmBase, "xdg_wm_base", 2, true },
    { capability_t::eDecorationManager, "zxdg_decoration_manager_v1", 1, false },
  } };

  const capability_info_t &
  info(capability_t);

  /// Maps an interface name onto the capability it unlocks, if it is one
  /// this client recognizes.
  std::optional<capability_t>
  capability_from_interface(std::string_view interface);

  /**
   * @brief Tracks the globals advertised by the server, and binds the
   * ones this client depends on.
   */
  class registry_t {
    public:
    struct binding_t {
      object_t handle;
      uint32_t name;
      uint32_t version;
      bool     lost{ false };
    };

    explicit registry_t(registry_requests_t &requests);

    event_outcome_t
    on_global(uint32_t name, std::string_view interface, uint32_t version);

    /**
     * @brief Forget a global.
     *
     * Unknown or unbound globals are dropped.  Losing the optional
     * decoration manager degrades the session (reported as
     * `eUnhandled'); losing any required capability throws
     * `fatal_error_t' (eUnhandledEvent).
     */
    event_outcome_t
    on_global_remove(uint32_t name);

    /**
     * @brief Bind the most recent advertisement of `capability', at
     * min(advertised version, client maximum).
     *
     * Returns `std::nullopt' if the capability was never advertised.
     * Binding a capability twice returns the existing handle.
     */
    std::optional<object_t>
    bind(capability_t capability);

    /**
     * @brief Bind every recognized capability that was advertised.
     *
     * Throws `fatal_error_t' (eMissingCapability) naming every required
     * capability the server did not advertise. The caller must perform
     * a roundtrip afterwards, before using any of the handles.
     */
    void
    bind_all();

    /// Handle of a bound, not lost, capability.
    std::optional<object_t>
    handle(capability_t capability) const;

    const global_t *
    find(std::string_view interface) const;

    const std::vector<global_t> &
    globals() const {
      return globals_;
    }

    size_t
    bound_count() const;

    private:
    registry_requests_t &requests_;

    // Insertion ordered, indexed by interface name.
    std::vector<global_t> globals_;

    std::array<std::optional<binding_t>, CAPABILITIES.size()> bindings_;
  };
}
