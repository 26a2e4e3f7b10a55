#include "wisp/shell/xdg_toplevel.hpp"

#include "../log.hpp"

#include <string>

namespace wisp {

  const char *
  to_string(toplevel_state_t state) {
    switch (state) {
      case toplevel_state_t::eMaximized:
        return "maximized";
      case toplevel_state_t::eFullscreen:
        return "fullscreen";
      case toplevel_state_t::eResizing:
        return "resizing";
      case toplevel_state_t::eActivated:
        return "activated";
      case toplevel_state_t::eTiledLeft:
        return "tiled_left";
      case toplevel_state_t::eTiledRight:
        return "tiled_right";
      case toplevel_state_t::eTiledTop:
        return "tiled_top";
      case toplevel_state_t::eTiledBottom:
        return "tiled_bottom";
      case toplevel_state_t::eSuspended:
        return "suspended";
    }
    return "unknown";
  }

  xdg_toplevel_t::xdg_toplevel_t(shell_requests_t          &requests,
                                 object_t                   handle,
                                 const xdg_toplevel_data_t &data)
    : requests_(requests)
    , handle_(handle)
    , data_(data) {
    requests_.set_title(handle_, data_.title);
    if (!data_.app_id.empty())
      requests_.set_app_id(handle_, data_.app_id);
  }

  event_outcome_t
  xdg_toplevel_t::configure(int32_t width, int32_t height, std::span<const uint32_t> states) {
    if (width > 0 && height > 0) {
      suggested_ = extent_t{ width, height };
    } else {
      suggested_.reset();
    }

    states_.assign(states.begin(), states.end());
    if (states_.empty()) {
      TRACE("xdg_toplevel::configure {}x{}", width, height);
      return event_outcome_t::eHandled;
    }

    std::string names;
    for (uint32_t state : states_) {
      if (!names.empty())
        names += ", ";
      names += to_string(static_cast<toplevel_state_t>(state));
    }
    INFO("xdg_toplevel::configure {}x{}, states: {}", width, height, names);
    return event_outcome_t::eUnhandled;
  }

  event_outcome_t
  xdg_toplevel_t::close() {
    INFO("Compositor asked **{}** to close", data_.title);
    events.on_close.emit();
    return event_outcome_t::eUnhandled;
  }
}
