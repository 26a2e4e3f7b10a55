#include "wisp/core/registry.hpp"

#include "../log.hpp"

#include <algorithm>
#include <format>

namespace wisp {

  const capability_info_t &
  info(capability_t capability) {
    return CAPABILITIES[static_cast<size_t>(capability)];
  }

  std::optional<capability_t>
  capability_from_interface(std::string_view interface) {
    for (auto const &cap : CAPABILITIES) {
      if (cap.interface == interface)
        return cap.capability;
    }
    return std::nullopt;
  }

  registry_t::registry_t(registry_requests_t &requests)
    : requests_(requests) {}

  event_outcome_t
  registry_t::on_global(uint32_t name, std::string_view interface, uint32_t version) {
    auto it = std::find_if(
      globals_.begin(), globals_.end(), [&](auto const &g) { return g.interface == interface; });

    if (it != globals_.end()) {
      TRACE("Global **{}** re-advertised ({} -> {}, v{})", interface, it->name, name, version);
      it->name    = name;
      it->version = version;
    } else {
      globals_.push_back(global_t{ .name = name, .interface = std::string(interface), .version = version });
    }

    if (!capability_from_interface(interface)) {
      TRACE("Ignoring global {} v{} (name {})", interface, version, name);
      return event_outcome_t::eIgnored;
    }

    INFO("New global **{}** v{} (name {})", interface, version, name);
    return event_outcome_t::eHandled;
  }

  event_outcome_t
  registry_t::on_global_remove(uint32_t name) {
    // A binding keeps the name it was bound under, even after the
    // interface was re-advertised under another one.
    auto bound = std::find_if(bindings_.begin(), bindings_.end(), [&](auto const &b) {
      return b && b->name == name && !b->lost;
    });

    auto it = std::find_if(
      globals_.begin(), globals_.end(), [&](auto const &g) { return g.name == name; });
    bool known = it != globals_.end();
    if (known)
      globals_.erase(it);

    if (bound == bindings_.end()) {
      if (!known) {
        TRACE("global_remove for unknown name {}", name);
        return event_outcome_t::eIgnored;
      }
      return event_outcome_t::eHandled;
    }

    auto const &cap       = CAPABILITIES[static_cast<size_t>(bound - bindings_.begin())];
    auto        interface = cap.interface;
    auto       &binding   = *bound;

    if (cap.required) {
      throw fatal_error_t(error_kind_t::eUnhandledEvent,
                          phase_t::eDispatch,
                          std::format("server removed bound global {} (name {})", interface, name));
    }

    WARN("Server removed optional global **{}**, continuing without it", interface);
    binding->lost = true;
    return event_outcome_t::eUnhandled;
  }

  std::optional<object_t>
  registry_t::bind(capability_t capability) {
    auto &binding = bindings_[static_cast<size_t>(capability)];
    if (binding)
      return binding->handle;

    auto const &cap    = info(capability);
    auto const *global = find(cap.interface);
    if (!global)
      return std::nullopt;

    uint32_t version = std::min(global->version, cap.max_version);
    TRACE("Binding {} (name {}) at v{}", cap.interface, global->name, version);

    object_t handle = requests_.bind(global->name, capability, version);
    binding         = binding_t{ .handle = handle, .name = global->name, .version = version };
    return handle;
  }

  void
  registry_t::bind_all() {
    std::string missing;
    for (auto const &cap : CAPABILITIES) {
      if (bind(cap.capability))
        continue;

      if (cap.required) {
        if (!missing.empty())
          missing += ", ";
        missing += cap.interface;
      } else {
        INFO("Optional global {} not advertised", cap.interface);
      }
    }

    if (!missing.empty()) {
      throw fatal_error_t(error_kind_t::eMissingCapability,
                          phase_t::eBinding,
                          std::format("server does not advertise: {}", missing));
    }
  }

  std::optional<object_t>
  registry_t::handle(capability_t capability) const {
    auto const &binding = bindings_[static_cast<size_t>(capability)];
    if (!binding || binding->lost)
      return std::nullopt;
    return binding->handle;
  }

  const global_t *
  registry_t::find(std::string_view interface) const {
    for (auto const &g : globals_) {
      if (g.interface == interface)
        return &g;
    }
    return nullptr;
  }

  size_t
  registry_t::bound_count() const {
    return std::count_if(
      bindings_.begin(), bindings_.end(), [](auto const &b) { return b && !b->lost; });
  }
}
