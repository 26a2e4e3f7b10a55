#pragma once

#include <functional>
#include <map>

// -----------------
//  signal_t<T>
// A minimal signal to let components observe each other without
// holding references in both directions.
// -----------------

namespace wisp {
  using signal_token_t = int;

  template<typename... Args>
  struct signal_t {
    private:
    std::map<signal_token_t, std::function<void(Args...)>> listeners;
    // Tokens are never reused, a stale token disconnects nothing.
    signal_token_t next_token = 0;

    public:
    signal_t() = default;
    signal_t(signal_t &&other) noexcept
      : listeners(std::move(other.listeners))
      , next_token(other.next_token) {}

    signal_t &
    operator=(signal_t &&other) noexcept {
      listeners  = std::move(other.listeners);
      next_token = other.next_token;
      return *this;
    }

    // Copying would duplicate listeners that captured `this`.
    signal_t(const signal_t &) = delete;
    signal_t &
    operator=(const signal_t &) = delete;

    signal_token_t
    connect(std::function<void(Args...)> cb) {
      signal_token_t tok = next_token++;
      listeners.emplace(tok, std::move(cb));
      return tok;
    }

    void
    disconnect(signal_token_t token) {
      listeners.erase(token);
    }

    void
    emit(Args... args) {
      for (auto const &[_, cb] : listeners) {
        cb(args...);
      }
    }

    size_t
    size() const {
      return listeners.size();
    }
  };
}
