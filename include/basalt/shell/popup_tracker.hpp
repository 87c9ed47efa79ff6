#pragma once

#include "basalt/core/region.hpp"
#include "basalt/core/surface_id.hpp"
#include "basalt/shell/positioner.hpp"
#include "basalt/shell/protocol.hpp"
#include "basalt/shell/surface_list.hpp"

#include <memory>
#include <vector>

namespace basalt {
  struct popup_entry_t {
    surface_id_t       surface;
    surface_id_t       parent;
    positioner_state_t positioner;

    /// Relative to the parent's window geometry.
    region_t geometry;

    bool initial_configure_sent{ false };

    popup_entry_t(surface_id_t surface, surface_id_t parent, const positioner_state_t &positioner)
      : surface(surface)
      , parent(parent)
      , positioner(positioner)
      , geometry(positioner.geometry()) {}
  };

  /// Tracks popups from their creation until their surface dies.
  class popup_tracker_t {
    surface_list_t<popup_entry_t> entries_;

    public:
    using const_iterator = surface_list_t<popup_entry_t>::const_iterator;

    std::shared_ptr<popup_entry_t>
    track(surface_id_t surface, surface_id_t parent, const positioner_state_t &positioner);

    std::shared_ptr<const popup_entry_t>
    find(surface_id_t surface) const;

    std::shared_ptr<popup_entry_t>
    find_mut(surface_id_t surface);

    bool
    contains(surface_id_t surface) const;

    /// Replace the positioner of a tracked popup and recompute its
    /// geometry. Returns false when the popup is unknown.
    bool
    reposition(surface_id_t surface, const positioner_state_t &positioner);

    /// Walks up the parent chain to the first surface that is not a
    /// popup. For a surface that is not a popup, returns itself.
    surface_id_t
    root_of(surface_id_t surface) const;

    /// Every popup whose chain ends at `root`, in creation order.
    std::vector<std::shared_ptr<const popup_entry_t>>
    popups_of(surface_id_t root) const;

    bool
    remove(surface_id_t surface);

    size_t
    refresh(const protocol_t &protocol);

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
  };
}
