#pragma once

#include "basalt/core/surface_id.hpp"
#include "basalt/shell/protocol.hpp"
#include "basalt/shell/surface_list.hpp"
#include "basalt/shell/window.hpp"

#include <memory>

namespace basalt {
  /// A toplevel that has a role but is not mapped yet.
  struct pending_toplevel_t {
    surface_id_t surface;
    bool         initial_configure_sent{ false };

    explicit pending_toplevel_t(surface_id_t surface)
      : surface(surface) {}
  };

  /**
   * @brief Toplevels waiting for their first buffer.
   *
   * A surface leaves this registry exactly once, either through
   * `try_promote` or because it died.
   */
  class pending_list_t {
    surface_list_t<pending_toplevel_t> entries_;

    public:
    using const_iterator = surface_list_t<pending_toplevel_t>::const_iterator;

    void
    insert(surface_id_t surface);

    std::shared_ptr<const pending_toplevel_t>
    find(surface_id_t surface) const;

    std::shared_ptr<pending_toplevel_t>
    find_mut(surface_id_t surface);

    bool
    contains(surface_id_t surface) const;

    /**
     * @brief Map the surface if it is ready.
     *
     * A surface is ready once it has a buffer attached and the
     * protocol can report its window geometry. On success the entry is
     * removed and a window placed at (0,0) is returned; otherwise
     * (including for surfaces not in this registry) null.
     */
    std::shared_ptr<window_t>
    try_promote(surface_id_t surface, const protocol_t &protocol);

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

    bool
    empty() const {
      return entries_.empty();
    }
  };
}
