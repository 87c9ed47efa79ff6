#pragma once

#include "basalt/core/surface_id.hpp"
#include "basalt/shell/protocol.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace basalt {

  /**
   * @brief Ordered collection of shell entries keyed by their surface.
   *
   * Insertion order is kept (the policy layer iterates it as
   * z-order), lookup by surface goes through a hash index. `_Entry`
   * needs a public `surface_id_t surface` member.
   */
  template<typename _Entry>
  class surface_list_t {
    std::vector<std::shared_ptr<_Entry>>                     entries_;
    std::unordered_map<surface_id_t, std::shared_ptr<_Entry>> index_;

    public:
    using iterator       = typename std::vector<std::shared_ptr<_Entry>>::iterator;
    using const_iterator = typename std::vector<std::shared_ptr<_Entry>>::const_iterator;

    std::shared_ptr<const _Entry>
    find(surface_id_t surface) const {
      auto it = index_.find(surface);
      if (it == index_.end())
        return nullptr;
      return it->second;
    }

    std::shared_ptr<_Entry>
    find_mut(surface_id_t surface) {
      auto it = index_.find(surface);
      if (it == index_.end())
        return nullptr;
      return it->second;
    }

    bool
    contains(surface_id_t surface) const {
      return index_.contains(surface);
    }

    /// Appends `entry`; a surface may only be present once.
    void
    insert(std::shared_ptr<_Entry> entry) {
      if (!entry)
        throw std::logic_error("surface_list_t: inserting an empty entry");
      if (index_.contains(entry->surface))
        throw std::logic_error("surface_list_t: surface is already present");

      index_.emplace(entry->surface, entry);
      entries_.push_back(std::move(entry));
    }

    bool
    remove(surface_id_t surface) {
      if (index_.erase(surface) == 0)
        return false;

      auto it = std::find_if(
        entries_.begin(), entries_.end(), [&](const auto &e) { return e->surface == surface; });
      if (it != entries_.end())
        entries_.erase(it);
      return true;
    }

    /// Drop entries whose surface is no longer alive. Survivors keep
    /// their relative order. Returns the number of removed entries.
    size_t
    refresh(const protocol_t &protocol) {
      auto removed = std::erase_if(entries_, [&](const auto &entry) {
        if (protocol.alive(entry->surface))
          return false;
        index_.erase(entry->surface);
        return true;
      });
      return removed;
    }

    iterator
    begin() {
      return entries_.begin();
    }

    iterator
    end() {
      return entries_.end();
    }

    const_iterator
    begin() const {
      return entries_.begin();
    }

    const_iterator
    end() const {
      return entries_.end();
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
