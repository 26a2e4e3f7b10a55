#include "wisp/session.hpp"

#include "log.hpp"

#include <format>

namespace wisp {

  session_t::session_t(connection_t &connection, window_options_t options)
    : connection_(connection)
    , options_(std::move(options))
    , registry_(connection) {}

  session_t::~session_t() {
    // Buffers issue destroy requests; make sure no event reaches us
    // while members are going away.
    window_.reset();
    connection_.set_handler(nullptr);
  }

  void
  session_t::start() {
    connection_.set_handler(this);

    TRACE("* Discovering globals");
    connection_.get_registry();
    connection_.roundtrip();

    TRACE("* Binding globals");
    registry_.bind_all();

    // Handlers for events the binds trigger (wl_shm.format, an early
    // ping) have to exist before the roundtrip delivers them.
    provisioner_.emplace(connection_, *registry_.handle(capability_t::eShm));
    wm_base_.emplace(connection_, *registry_.handle(capability_t::eWmBase));

    connection_.roundtrip();
    INFO("Bound {} capabilities", registry_.bound_count());

    TRACE("* Creating window");
    window_ = std::make_unique<xdg_surface_t>(connection_, *provisioner_, options_);
    window_->create(*registry_.handle(capability_t::eCompositor),
                    wm_base_->handle(),
                    registry_.handle(capability_t::eDecorationManager));
  }

  void
  session_t::dispatch_once() {
    connection_.dispatch();
  }

  void
  session_t::run() {
    for (;;) {
      dispatch_once();
    }
  }

  event_outcome_t
  session_t::account(event_outcome_t outcome, std::string_view event) {
    if (outcome == event_outcome_t::eUnhandled) {
      unhandled_++;
      WARN("Unhandled event **{}** ({} so far)", event, unhandled_);
    }
    return outcome;
  }

  void
  session_t::unexpected(std::string_view event, object_t source) const {
    throw fatal_error_t(error_kind_t::eProtocolSequence,
                        phase_t::eDispatch,
                        std::format("{} from unexpected object {:#x}", event, source.value));
  }

  event_outcome_t
  session_t::on_global(uint32_t name, std::string_view interface, uint32_t version) {
    return account(registry_.on_global(name, interface, version), "wl_registry.global");
  }

  event_outcome_t
  session_t::on_global_remove(uint32_t name) {
    return account(registry_.on_global_remove(name), "wl_registry.global_remove");
  }

  event_outcome_t
  session_t::on_shm_format(object_t shm, uint32_t format) {
    if (!provisioner_ || registry_.handle(capability_t::eShm) != shm)
      unexpected("wl_shm.format", shm);

    provisioner_->on_format(format);
    TRACE("wl_shm::format {:#x}", format);
    return event_outcome_t::eHandled;
  }

  event_outcome_t
  session_t::on_ping(object_t wm_base, uint32_t serial) {
    if (!wm_base_ || wm_base_->handle() != wm_base)
      unexpected("xdg_wm_base.ping", wm_base);
    return account(wm_base_->ping(serial), "xdg_wm_base.ping");
  }

  event_outcome_t
  session_t::on_surface_configure(object_t xdg_surface, uint32_t serial) {
    if (!window_ || window_->handle() != xdg_surface)
      unexpected("xdg_surface.configure", xdg_surface);
    return account(window_->configure(serial), "xdg_surface.configure");
  }

  event_outcome_t
  session_t::on_toplevel_configure(object_t                  toplevel,
                                   int32_t                   width,
                                   int32_t                   height,
                                   std::span<const uint32_t> states) {
    if (!window_ || !window_->toplevel() || window_->toplevel()->handle() != toplevel)
      unexpected("xdg_toplevel.configure", toplevel);
    return account(window_->toplevel()->configure(width, height, states), "xdg_toplevel.configure");
  }

  event_outcome_t
  session_t::on_toplevel_close(object_t toplevel) {
    if (!window_ || !window_->toplevel() || window_->toplevel()->handle() != toplevel)
      unexpected("xdg_toplevel.close", toplevel);
    return account(window_->toplevel()->close(), "xdg_toplevel.close");
  }

  event_outcome_t
  session_t::on_decoration_configure(object_t decoration, uint32_t mode) {
    if (!window_ || !window_->decoration() || window_->decoration()->handle() != decoration)
      unexpected("zxdg_toplevel_decoration_v1.configure", decoration);
    return account(window_->decoration()->configure(mode), "zxdg_toplevel_decoration_v1.configure");
  }

  event_outcome_t
  session_t::on_buffer_release(object_t buffer) {
    if (!window_ || !window_->owns_buffer(buffer))
      unexpected("wl_buffer.release", buffer);
    return account(window_->release(buffer), "wl_buffer.release");
  }

  event_outcome_t
  session_t::on_unhandled(object_t, std::string_view event) {
    return account(event_outcome_t::eUnhandled, event);
  }
}
