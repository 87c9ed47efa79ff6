#pragma once

#include "basalt/core/point.hpp"
#include "basalt/core/region.hpp"
#include "basalt/core/serial_queue.hpp"
#include "basalt/core/signal.hpp"
#include "basalt/shell/positioner.hpp"
#include "basalt/wayland/resource.hpp"
#include "basalt/wayland/surface.hpp"

#include "wl/xdg-shell-protocol.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <wayland-server-core.h>

extern const struct xdg_wm_base_interface    xdg_wm_base_impl;
extern const struct xdg_positioner_interface xdg_positioner_impl;
extern const struct xdg_surface_interface    xdg_surface_impl;
extern const struct xdg_toplevel_interface   xdg_toplevel_impl;
extern const struct xdg_popup_interface      xdg_popup_impl;

namespace basalt::wayland {
  class server_t;

  class xdg_wm_base_t {
    public:
    server_t  &server;
    wl_global *global;

    static constexpr uint32_t MAX_VERSION = 3;

    xdg_wm_base_t(server_t &server, uint32_t version);
    ~xdg_wm_base_t();

    private:
    static void
    bind(wl_client *, void *, uint32_t, uint32_t);
  };

  /// One client's binding of the xdg_wm_base global.
  struct xdg_wm_base_binding_t {
    xdg_wm_base_t &shell;
    /// xdg_surfaces created from this binding and still alive.
    uint32_t       surfaces{ 0 };

    explicit xdg_wm_base_binding_t(xdg_wm_base_t &shell)
      : shell(shell) {}
  };

  struct xdg_positioner_t {
    positioner_state_t state;
  };

  enum class xdg_role_t { eNone, eToplevel, ePopup };

  struct xdg_surface_t {
    server_t                            &server;
    std::weak_ptr<resource_t<surface_t>> surface;

    /// The xdg_wm_base this surface was created from; protocol errors
    /// about roles are posted there.
    std::weak_ptr<resource_t<xdg_wm_base_binding_t>> wm_base;

    xdg_role_t   role{ xdg_role_t::eNone };
    wl_resource *role_object{ nullptr };

    std::optional<region_t> pending_geometry;

    serial_queue_t<uint32_t> pending_serials;
    bool                     configured{ false };

    signal_token_t on_commit{ -1 };

    xdg_surface_t(server_t                             &server,
                  resource_ptr_t<surface_t>             surface,
                  resource_ptr_t<xdg_wm_base_binding_t> wm_base);
    ~xdg_surface_t();

    xdg_surface_t(const xdg_surface_t &) = delete;
    xdg_surface_t &
    operator=(const xdg_surface_t &) = delete;

    /// Post an `xdg_wm_base` error on the binding this surface was
    /// created from, or on `self` once the binding is gone.
    void
    post_wm_base_error(wl_resource *self, uint32_t code, const char *message);
  };

  struct xdg_toplevel_t {
    std::weak_ptr<resource_t<xdg_surface_t>> xdg_surface;

    std::string title, app_id;
    ipoint_t    min_size{ 0, 0 }, max_size{ 0, 0 };

    std::weak_ptr<resource_t<xdg_toplevel_t>> parent;

    explicit xdg_toplevel_t(resource_ptr_t<xdg_surface_t> xdg_surface)
      : xdg_surface(xdg_surface) {}
  };

  struct xdg_popup_t {
    std::weak_ptr<resource_t<xdg_surface_t>> xdg_surface;

    /// Null for popups parented later through
    /// `zwlr_layer_surface_v1.get_popup`.
    std::weak_ptr<resource_t<surface_t>> parent;
    positioner_state_t                   positioner;

    xdg_popup_t(resource_ptr_t<xdg_surface_t> xdg_surface, const positioner_state_t &positioner)
      : xdg_surface(xdg_surface)
      , positioner(positioner) {}
  };
}
