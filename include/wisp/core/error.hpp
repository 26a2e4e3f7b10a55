#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace wisp {

  enum class error_kind_t {
    eAllocation,        ///< memfd, ftruncate or mmap failed
    eMissingCapability, ///< required global never advertised
    eProtocolSequence,  ///< event arrived in a state that does not expect it
    eUnhandledEvent,    ///< recognized event with no policy (fatal variant)
    eConnection,        ///< transport failure or protocol error from the server
  };

  /// Session phase an error was raised in, reported at the process boundary.
  enum class phase_t { eConnect, eAllocation, eBinding, eHandshake, eDispatch };

  /// What a handler did with an event. `eUnhandled' is never dropped
  /// silently, the session logs and counts it.
  enum class event_outcome_t { eHandled, eIgnored, eUnhandled };

  class fatal_error_t : public std::runtime_error {
    error_kind_t kind_;
    phase_t      phase_;

    public:
    fatal_error_t(error_kind_t kind, phase_t phase, const std::string &message)
      : std::runtime_error(message)
      , kind_(kind)
      , phase_(phase) {}

    error_kind_t
    kind() const {
      return kind_;
    }

    phase_t
    phase() const {
      return phase_;
    }
  };

  constexpr const char *
  to_string(phase_t phase) {
    switch (phase) {
      case phase_t::eConnect:
        return "connect";
      case phase_t::eAllocation:
        return "allocation";
      case phase_t::eBinding:
        return "binding";
      case phase_t::eHandshake:
        return "handshake";
      case phase_t::eDispatch:
        return "dispatch";
    }
    return "unknown";
  }

  constexpr const char *
  to_string(error_kind_t kind) {
    switch (kind) {
      case error_kind_t::eAllocation:
        return "AllocationError";
      case error_kind_t::eMissingCapability:
        return "MissingCapability";
      case error_kind_t::eProtocolSequence:
        return "ProtocolSequenceError";
      case error_kind_t::eUnhandledEvent:
        return "UnhandledEvent";
      case error_kind_t::eConnection:
        return "ConnectionError";
    }
    return "unknown";
  }

  /**
   * @brief Run `body', reporting anything it throws as a single
   * `CRITICAL' line.
   *
   * Returns the process exit status: 0 if `body' returned, 1 otherwise.
   */
  int
  run_guarded(const std::function<void()> &body);
}
