#include "basalt/shell/popup_tracker.hpp"

#include <unordered_set>

namespace basalt {

  std::shared_ptr<popup_entry_t>
  popup_tracker_t::track(surface_id_t              surface,
                         surface_id_t              parent,
                         const positioner_state_t &positioner) {
    auto entry = std::make_shared<popup_entry_t>(surface, parent, positioner);
    entries_.insert(entry);
    return entry;
  }

  std::shared_ptr<const popup_entry_t>
  popup_tracker_t::find(surface_id_t surface) const {
    return entries_.find(surface);
  }

  std::shared_ptr<popup_entry_t>
  popup_tracker_t::find_mut(surface_id_t surface) {
    return entries_.find_mut(surface);
  }

  bool
  popup_tracker_t::contains(surface_id_t surface) const {
    return entries_.contains(surface);
  }

  bool
  popup_tracker_t::reposition(surface_id_t surface, const positioner_state_t &positioner) {
    auto entry = entries_.find_mut(surface);
    if (!entry)
      return false;

    entry->positioner = positioner;
    entry->geometry   = positioner.geometry();
    return true;
  }

  surface_id_t
  popup_tracker_t::root_of(surface_id_t surface) const {
    // A malformed parent cycle must not hang the compositor.
    std::unordered_set<surface_id_t> seen;

    auto current = surface;
    while (auto entry = entries_.find(current)) {
      if (!seen.insert(current).second)
        break;
      current = entry->parent;
    }
    return current;
  }

  std::vector<std::shared_ptr<const popup_entry_t>>
  popup_tracker_t::popups_of(surface_id_t root) const {
    std::vector<std::shared_ptr<const popup_entry_t>> result;
    for (const auto &entry : entries_) {
      if (root_of(entry->surface) == root)
        result.push_back(entry);
    }
    return result;
  }

  bool
  popup_tracker_t::remove(surface_id_t surface) {
    return entries_.remove(surface);
  }

  size_t
  popup_tracker_t::refresh(const protocol_t &protocol) {
    return entries_.refresh(protocol);
  }

}
