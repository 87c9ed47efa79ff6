#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

namespace basalt {

  /**
   * @brief Configures sent to a client and not acknowledged yet, oldest first.
   *
   * Acking a serial retires it together with every older entry. At most
   * `MAX_PENDING` entries are kept; a client that never acks loses the
   * oldest ones, and acking one of those later is an unknown serial.
   *
   * @tparam _Ty Either the serial itself or a record with a `serial` member.
   */
  template<typename _Ty>
  class serial_queue_t {
    std::deque<_Ty> entries_;

    static uint32_t
    serial_of(const _Ty &entry) {
      if constexpr (std::is_integral_v<_Ty>)
        return entry;
      else
        return entry.serial;
    }

    public:
    static constexpr size_t MAX_PENDING = 32;

    void
    push(_Ty entry) {
      if (entries_.size() == MAX_PENDING)
        entries_.pop_front();
      entries_.push_back(std::move(entry));
    }

    /// Retire `serial` and everything sent before it. Returns the
    /// retired entry, or nothing when `serial` is not pending.
    std::optional<_Ty>
    ack(uint32_t serial) {
      for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (serial_of(*it) != serial)
          continue;

        _Ty entry = *it;
        entries_.erase(entries_.begin(), std::next(it));
        return entry;
      }
      return std::nullopt;
    }

    const _Ty &
    operator[](size_t i) const {
      return entries_[i];
    }

    size_t
    size() const {
      return entries_.size();
    }

    bool
    empty() const {
      return entries_.empty();
    }
  };

}
