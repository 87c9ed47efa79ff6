#pragma once

#include "basalt/core/config.hpp"
#include "basalt/core/slot_table.hpp"
#include "basalt/shell/protocol.hpp"
#include "basalt/shell/shell.hpp"
#include "basalt/wayland/resource.hpp"
#include "basalt/wayland/surface.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <wayland-server-core.h>

namespace basalt::wayland {
  class wl_compositor_t;
  class wl_subcompositor_t;
  class xdg_wm_base_t;
  class layer_shell_t;

  /**
   * @brief Headless Wayland server hosting the shell.
   *
   * Owns the `wl_display`, the protocol globals and the `shell_t`, and
   * answers the shell's queries about surfaces. Surface ids are minted
   * here; a surface gets a fresh id whenever its role object is
   * destroyed, so stale shell entries die with the old id.
   */
  class server_t : public protocol_t {
    using surface_ref_t = std::weak_ptr<resource_t<surface_t>>;

    wl_display    *display_;
    wl_event_loop *loop_;
    std::string    socket_;

    slot_table_t<surface_ref_t> surfaces_;
    shell_t                     shell_;

    std::unique_ptr<wl_compositor_t>    compositor_;
    std::unique_ptr<wl_subcompositor_t> subcompositor_;
    std::unique_ptr<xdg_wm_base_t>      xdg_wm_base_;
    std::unique_ptr<layer_shell_t>      layer_shell_;

    wl_event_source *sigint_{ nullptr }, *sigterm_{ nullptr };
    bool             running_{ false };

    resource_ptr_t<surface_t>
    lookup(surface_id_t) const;

    public:
    /// Validates interactive grabs. There is no input stack in this
    /// server; an embedder that has one installs it here. Without it,
    /// no move, resize or popup grab is ever started.
    std::function<std::optional<grab_start_data_t>(seat_id_t, uint32_t, surface_id_t)>
      grab_lookup;

    explicit server_t(const config_t &config);
    ~server_t() override;

    server_t(const server_t &) = delete;
    server_t &
    operator=(const server_t &) = delete;

    shell_t &
    shell() {
      return shell_;
    }

    wl_display *
    display() const {
      return display_;
    }

    const std::string &
    socket() const {
      return socket_;
    }

    uint32_t
    next_serial();

    /// Mint the id of a freshly created wl_surface.
    surface_id_t
    register_surface(const resource_ptr_t<surface_t> &);

    /// The wl_surface is gone.
    void
    unregister_surface(surface_t &);

    /// The role object of `surface` is gone; the surface stays but is
    /// known under a new id from now on.
    void
    retire_role(surface_t &);

    /// Block in the event loop until `terminate` is called or a
    /// SIGINT/SIGTERM arrives.
    void
    run();

    void
    terminate();

    // protocol_t

    bool
    alive(surface_id_t) const override;

    bool
    has_buffer(surface_id_t) const override;

    bool
    is_sync_subsurface(surface_id_t) const override;

    std::vector<surface_id_t>
    surface_tree(surface_id_t) const override;

    std::optional<region_t>
    window_geometry(surface_id_t) const override;

    std::optional<grab_start_data_t>
    grab_start_data(seat_id_t, uint32_t serial, surface_id_t) const override;

    void
    import_buffer(surface_id_t) override;

    uint32_t
    send_toplevel_configure(surface_id_t, const toplevel_state_t &) override;

    uint32_t
    send_popup_configure(surface_id_t, const region_t &geometry) override;

    uint32_t
    send_layer_configure(surface_id_t, const ipoint_t &size) override;
  };
}
