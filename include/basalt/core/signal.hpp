#pragma once

#include <functional>
#include <map>
#include <vector>

// -----------------
//  signal_t<T>
// This header defines a simple signal system to attach events to objects.
// -----------------

namespace basalt {
  using signal_token_t = int;

  /// Returned by listeners; `eDelete` disconnects the listener after
  /// the current emission.
  enum class signal_action_t { eOk, eDelete };

  template<typename... Args>
  struct signal_t {
    private:
    using _Listener = std::function<signal_action_t(Args...)>;
    std::map<signal_token_t, _Listener> listeners;
    signal_token_t                      next_token{ 0 };

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

    // Copying signals is not allowed, this would break assumptions on
    // the listeners.
    signal_t(const signal_t &) = delete;
    signal_t &
    operator=(const signal_t &) = delete;

    signal_token_t
    connect(_Listener cb) {
      // Tokens are never reused, a stale disconnect must not hit a newer listener.
      signal_token_t tok = next_token++;
      listeners.emplace(tok, std::move(cb));
      return tok;
    }

    void
    disconnect(signal_token_t token) {
      listeners.erase(token);
    }

    /// Listeners may connect or disconnect other listeners while an
    /// emission is running; we iterate over a snapshot of the tokens.
    void
    emit(Args... args) {
      std::vector<signal_token_t> tokens;
      tokens.reserve(listeners.size());
      for (const auto &[tok, _] : listeners)
        tokens.push_back(tok);

      for (auto tok : tokens) {
        auto it = listeners.find(tok);
        if (it == listeners.end())
          continue;

        // Copy, the listener may disconnect itself.
        _Listener cb = it->second;
        if (cb(args...) == signal_action_t::eDelete)
          listeners.erase(tok);
      }
    }

    size_t
    size() const {
      return listeners.size();
    }
  };

}
