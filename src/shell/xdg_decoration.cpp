#include "wisp/shell/xdg_decoration.hpp"

#include "../log.hpp"

namespace wisp {

  const char *
  to_string(decoration_mode_t mode) {
    switch (mode) {
      case decoration_mode_t::eClientSide:
        return "client_side";
      case decoration_mode_t::eServerSide:
        return "server_side";
    }
    return "unknown";
  }

  toplevel_decoration_t::toplevel_decoration_t(shell_requests_t &requests,
                                               object_t          manager,
                                               object_t          toplevel,
                                               decoration_mode_t preferred)
    : requests_(requests)
    , handle_(requests.get_toplevel_decoration(manager, toplevel))
    , requested_(preferred) {
    requests_.set_decoration_mode(handle_, requested_);
  }

  event_outcome_t
  toplevel_decoration_t::configure(uint32_t mode) {
    if (mode != static_cast<uint32_t>(decoration_mode_t::eClientSide)
        && mode != static_cast<uint32_t>(decoration_mode_t::eServerSide)) {
      WARN("Decoration configure with unknown mode {}", mode);
      return event_outcome_t::eUnhandled;
    }

    current_ = static_cast<decoration_mode_t>(mode);
    if (*current_ != requested_) {
      INFO("Compositor chose {} decorations (requested {})", to_string(*current_), to_string(requested_));
    } else {
      INFO("Decoration mode: {}", to_string(*current_));
    }

    events.on_mode.emit(*current_);
    return event_outcome_t::eHandled;
  }
}
