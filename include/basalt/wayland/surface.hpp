#pragma once

#include "basalt/core/point.hpp"
#include "basalt/core/region.hpp"
#include "basalt/core/signal.hpp"
#include "basalt/core/surface_id.hpp"
#include "basalt/wayland/resource.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <wayland-server-core.h>

extern const struct wl_surface_interface wl_surface_impl;

namespace basalt::wayland {
  class server_t;
  struct subsurface_t;

  /**
   * @brief Reference to a client `wl_buffer` that notices when the
   * client destroys it.
   */
  struct buffer_ref_t {
    wl_resource *buffer;
    wl_listener  on_destroy;

    explicit buffer_ref_t(wl_resource *buffer);
    ~buffer_ref_t();

    buffer_ref_t(const buffer_ref_t &) = delete;
    buffer_ref_t &
    operator=(const buffer_ref_t &) = delete;
  };

  /// Double-buffered wl_surface state.
  struct surface_state_t {
    /// True when `attach` was called since the last commit; a null
    /// `buffer` then detaches.
    bool                          attached{ false };
    std::shared_ptr<buffer_ref_t> buffer;
    ipoint_t                      offset{ 0, 0 };
    std::optional<int32_t>        scale;
    std::vector<wl_resource *>    frame_callbacks;

    /// Fold a newer state into this one, as for a synchronized
    /// subsurface collecting commits.
    void
    merge(surface_state_t &&newer);
  };

  /// The roles a wl_surface can take; the first one assigned sticks.
  enum class surface_role_t { eNone, eSubsurface, eXdgToplevel, eXdgPopup, eLayerSurface };

  const char *
  to_string(surface_role_t);

  struct surface_t {
    server_t    &server;
    surface_id_t id;

    surface_state_t staging, cached;
    bool            has_cache{ false };

    // Applied state.

    /// Committed but not yet imported.
    std::shared_ptr<buffer_ref_t> buffer;
    /// Surface-local size of the current buffer, empty while unmapped.
    std::optional<ipoint_t>    size;
    int32_t                    scale{ 1 };
    std::vector<wl_resource *> frame_callbacks;

    /// Set by xdg_surface.set_window_geometry.
    std::optional<region_t> window_geometry;

    surface_role_t role{ surface_role_t::eNone };

    /// xdg_toplevel, xdg_popup or zwlr_layer_surface_v1; null once the
    /// role object is gone.
    wl_resource *role_object{ nullptr };
    wl_resource *xdg_surface{ nullptr };

    /// Set while this surface is a subsurface of another one.
    std::shared_ptr<subsurface_t>              subsurface;
    std::vector<std::shared_ptr<subsurface_t>> children;

    struct {
      /// Emitted after the committed state was applied, before the
      /// shell sees the commit. Role objects apply their own
      /// double-buffered state from here.
      signal_t<surface_t &> on_commit;
    } events;

    explicit surface_t(server_t &server);
    ~surface_t();

    surface_t(const surface_t &) = delete;
    surface_t &
    operator=(const surface_t &) = delete;

    /// Assign `role`; returns false when the surface already carries
    /// a different role.
    bool
    set_role(surface_role_t role);

    /// True when this is a subsurface in synchronized mode, or a
    /// descendant of one.
    bool
    synchronized() const;

    /// Make `state` current and recurse into synchronized children
    /// with cached state.
    void
    apply(surface_state_t &&state);

    /// Remove `callback` from every state list; it is being destroyed.
    void
    forget_frame_callback(wl_resource *callback);
  };

  struct subsurface_t {
    std::weak_ptr<resource_t<surface_t>> surface, parent;

    ipoint_t position{ 0, 0 };
    /// Applied on the parent's next commit.
    ipoint_t pending_position{ 0, 0 };
    bool     sync{ true };
  };
}
