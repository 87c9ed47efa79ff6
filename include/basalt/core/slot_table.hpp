#pragma once

#include "basalt/core/surface_id.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace basalt {

  /**
   * @brief Generational slot table keyed by `surface_id_t`.
   *
   * The table is used in two ways: as the arena that hands out
   * surface ids (`insert`), and as a side table attached to ids that
   * were allocated elsewhere (`ensure`). A single instance should only
   * ever be used in one of the two modes. Only arena tables keep a free
   * list; a side table reuses the index the owning arena hands it.
   *
   * `with_mut` grants exclusive access to one slot. While a slot is
   * borrowed, borrowing it again, or inserting/erasing anything,
   * throws `std::logic_error`; the storage could move underneath the
   * borrowed reference otherwise.
   */
  template<typename _Ty>
  class slot_table_t {
    struct slot_t {
      uint32_t           generation{ 1 };
      bool               borrowed{ false };
      std::optional<_Ty> value;
    };

    std::vector<slot_t>   slots_;
    std::vector<uint32_t> free_;
    size_t                size_{ 0 };
    size_t                borrows_{ 0 };
    bool                  arena_{ false };

    void
    release(slot_t &slot, uint32_t index) {
      slot.value.reset();
      ++slot.generation;
      if (arena_)
        free_.push_back(index);
      --size_;
    }

    void
    check_unborrowed(const char *operation) const {
      if (borrows_ > 0)
        throw std::logic_error(std::string("slot_table_t: ") + operation +
                               " while a slot is borrowed");
    }

    slot_t *
    lookup(surface_id_t id) {
      if (!id.valid() || id.index >= slots_.size())
        return nullptr;
      auto &slot = slots_[id.index];
      if (!slot.value || slot.generation != id.generation)
        return nullptr;
      return &slot;
    }

    const slot_t *
    lookup(surface_id_t id) const {
      return const_cast<slot_table_t *>(this)->lookup(id);
    }

    public:
    slot_table_t() = default;

    slot_table_t(const slot_table_t &) = delete;
    slot_table_t &
    operator=(const slot_table_t &) = delete;

    /// Store `value` in a free slot and return its freshly minted id.
    surface_id_t
    insert(_Ty value) {
      check_unborrowed("insert");
      arena_ = true;

      uint32_t index;
      if (!free_.empty()) {
        index = free_.back();
        free_.pop_back();
      } else {
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
      }

      auto &slot = slots_[index];
      slot.value.emplace(std::move(value));
      ++size_;
      return surface_id_t{ .index = index, .generation = slot.generation };
    }

    /// Insert-if-missing for ids minted by another table. A stale
    /// occupant (older generation) in the same slot is replaced.
    template<typename... _Args>
    _Ty &
    ensure(surface_id_t id, _Args &&...args) {
      if (!id.valid())
        throw std::logic_error("slot_table_t: ensure on an invalid surface id");

      if (auto *slot = lookup(id))
        return *slot->value;

      check_unborrowed("ensure");
      if (id.index >= slots_.size())
        slots_.resize(static_cast<size_t>(id.index) + 1);

      auto &slot = slots_[id.index];
      if (!slot.value) {
        if (arena_)
          std::erase(free_, id.index);
        ++size_;
      }
      slot.generation = id.generation;
      slot.value.emplace(std::forward<_Args>(args)...);
      return *slot.value;
    }

    _Ty *
    find(surface_id_t id) {
      auto *slot = lookup(id);
      return slot ? &*slot->value : nullptr;
    }

    const _Ty *
    find(surface_id_t id) const {
      auto *slot = lookup(id);
      return slot ? &*slot->value : nullptr;
    }

    bool
    contains(surface_id_t id) const {
      return lookup(id) != nullptr;
    }

    bool
    erase(surface_id_t id) {
      auto *slot = lookup(id);
      if (!slot)
        return false;
      check_unborrowed("erase");

      release(*slot, id.index);
      return true;
    }

    /// Drop every entry for which `keep(id, value)` returns false.
    template<typename _Predicate>
    size_t
    retain(_Predicate &&keep) {
      check_unborrowed("retain");

      size_t removed = 0;
      for (uint32_t i = 0; i < slots_.size(); ++i) {
        auto &slot = slots_[i];
        if (!slot.value)
          continue;

        surface_id_t id{ .index = i, .generation = slot.generation };
        if (!keep(id, std::as_const(*slot.value))) {
          release(slot, i);
          ++removed;
        }
      }
      return removed;
    }

    /**
     * @brief Run `fn` with exclusive access to the value stored for `id`.
     *
     * Returns `false` (or an empty optional for callables returning a
     * value) when `id` is not present.
     */
    template<typename _Fn>
    auto
    with_mut(surface_id_t id, _Fn &&fn) {
      using _Result = std::invoke_result_t<_Fn, _Ty &>;

      struct borrow_t {
        slot_t &slot;
        size_t &borrows;
        ~borrow_t() {
          slot.borrowed = false;
          --borrows;
        }
      };

      auto *slot = lookup(id);
      if constexpr (std::is_void_v<_Result>) {
        if (!slot)
          return false;
        if (slot->borrowed)
          throw std::logic_error("slot_table_t: slot is already mutably borrowed");
        slot->borrowed = true;
        ++borrows_;
        borrow_t guard{ *slot, borrows_ };
        std::invoke(std::forward<_Fn>(fn), *slot->value);
        return true;
      } else {
        if (!slot)
          return std::optional<_Result>{};
        if (slot->borrowed)
          throw std::logic_error("slot_table_t: slot is already mutably borrowed");
        slot->borrowed = true;
        ++borrows_;
        borrow_t guard{ *slot, borrows_ };
        return std::optional<_Result>{ std::invoke(std::forward<_Fn>(fn), *slot->value) };
      }
    }

    size_t
    size() const {
      return size_;
    }

    bool
    empty() const {
      return size_ == 0;
    }

    /// Number of slots allocated, occupied or not.
    size_t
    capacity() const {
      return slots_.size();
    }

    size_t
    free_slots() const {
      return free_.size();
    }
  };

}
