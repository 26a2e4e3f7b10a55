#include "wisp/shell/xdg_surface.hpp"

#include "../log.hpp"

#include <algorithm>
#include <format>

namespace wisp {

  const char *
  to_string(handshake_state_t state) {
    switch (state) {
      case handshake_state_t::eCreated:
        return "created";
      case handshake_state_t::eAwaitingConfigure:
        return "awaiting_configure";
      case handshake_state_t::eConfigured:
        return "configured";
      case handshake_state_t::eCommitted:
        return "committed";
    }
    return "unknown";
  }

  xdg_surface_t::xdg_surface_t(shell_requests_t     &requests,
                               buffer_provisioner_t &provisioner,
                               window_options_t      options)
    : requests_(requests)
    , provisioner_(provisioner)
    , options_(std::move(options)) {}

  xdg_surface_t::~xdg_surface_t() {}

  void
  xdg_surface_t::create(object_t                compositor,
                        object_t                wm_base,
                        std::optional<object_t> decoration_manager) {
    if (state_ != handshake_state_t::eCreated || surface_) {
      throw fatal_error_t(error_kind_t::eProtocolSequence,
                          phase_t::eHandshake,
                          "window roles were already created");
    }

    surface_     = requests_.create_surface(compositor);
    xdg_surface_ = requests_.get_xdg_surface(wm_base, surface_);
    toplevel_    = std::make_unique<xdg_toplevel_t>(
      requests_, requests_.get_toplevel(xdg_surface_), options_.toplevel);

    if (decoration_manager && options_.decorations) {
      decoration_ = std::make_unique<toplevel_decoration_t>(
        requests_, *decoration_manager, toplevel_->handle(), *options_.decorations);
    } else if (options_.decorations) {
      INFO("No decoration manager, leaving decorations to the compositor's default");
    }

    // Initial commit, no buffer may be attached before the first
    // configure.
    requests_.commit(surface_);
    state_ = handshake_state_t::eAwaitingConfigure;

    TRACE("Window **{}** created, awaiting configure", options_.toplevel.title);
  }

  event_outcome_t
  xdg_surface_t::configure(uint32_t serial) {
    switch (state_) {
      case handshake_state_t::eAwaitingConfigure:
      case handshake_state_t::eCommitted:
        break;
      case handshake_state_t::eCreated:
      case handshake_state_t::eConfigured:
        throw fatal_error_t(
          error_kind_t::eProtocolSequence,
          phase_t::eHandshake,
          std::format("xdg_surface.configure({}) while window is {}", serial, to_string(state_)));
    }

    INFO("xdg_surface::configure serial={}", serial);
    present(ack(configure_t(serial)));
    return event_outcome_t::eHandled;
  }

  xdg_surface_t::acked_configure_t
  xdg_surface_t::ack(configure_t &&configure) {
    requests_.ack_configure(xdg_surface_, configure.serial());
    state_ = handshake_state_t::eConfigured;
    return acked_configure_t(configure.serial());
  }

  void
  xdg_surface_t::present(const acked_configure_t &configure) {
    shm_buffer_t &buffer = acquire_buffer(target_size());

    requests_.attach(surface_, buffer.buffer, 0, 0);
    buffer.mark_busy();
    requests_.damage(surface_, 0, 0, buffer.width, buffer.height);
    requests_.commit(surface_);
    state_ = handshake_state_t::eCommitted;

    events.on_commit.emit(configure.serial());
  }

  extent_t
  xdg_surface_t::target_size() const {
    if (toplevel_) {
      if (auto suggested = toplevel_->suggested_size(); suggested)
        return *suggested;
    }
    return options_.size;
  }

  shm_buffer_t &
  xdg_surface_t::acquire_buffer(extent_t size) {
    if (current_ && !current_->busy && current_->width == size.width
        && current_->height == size.height) {
      TRACE("Reusing released {}x{} buffer", size.width, size.height);
      return *current_;
    }

    if (current_) {
      if (current_->busy) {
        // The server may still read from it; keep it mapped until
        // `wl_buffer.release'.
        retired_.push_back(std::move(current_));
      } else {
        current_.reset();
      }
    }

    current_ = provisioner_.provision(size.width, size.height, options_.format);
    current_->fill(options_.color);
    return *current_;
  }

  event_outcome_t
  xdg_surface_t::release(object_t buffer) {
    if (current_ && current_->buffer == buffer) {
      current_->release();
      TRACE("wl_buffer::release (attached buffer)");
      return event_outcome_t::eHandled;
    }

    auto it = std::find_if(
      retired_.begin(), retired_.end(), [&](auto const &b) { return b->buffer == buffer; });
    if (it != retired_.end()) {
      (*it)->release();
      retired_.erase(it);
      TRACE("wl_buffer::release (retired buffer freed, {} left)", retired_.size());
      return event_outcome_t::eHandled;
    }

    WARN("Release for unknown wl_buffer {:#x}", buffer.value);
    return event_outcome_t::eIgnored;
  }

  bool
  xdg_surface_t::owns_buffer(object_t buffer) const {
    if (current_ && current_->buffer == buffer)
      return true;
    return std::any_of(
      retired_.begin(), retired_.end(), [&](auto const &b) { return b->buffer == buffer; });
  }
}
