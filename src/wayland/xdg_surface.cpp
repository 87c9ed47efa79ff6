#include "basalt/wayland/server.hpp"
#include "basalt/wayland/xdg_shell.hpp"

#include "../log.hpp"
#include "wl/xdg-shell-protocol.h"

#include <utility>
#include <wayland-server-core.h>

using namespace basalt;
using namespace basalt::wayland;

namespace basalt::wayland {
  xdg_surface_t::xdg_surface_t(server_t                             &server,
                               resource_ptr_t<surface_t>             base,
                               resource_ptr_t<xdg_wm_base_binding_t> binding)
    : server(server)
    , surface(base)
    , wm_base(binding) {
    binding->surfaces++;

    on_commit = base->events.on_commit.connect([this](surface_t &surface) {
      if (pending_geometry)
        surface.window_geometry = std::exchange(pending_geometry, std::nullopt);

      if (role == xdg_role_t::eNone) {
        wl_resource_post_error(surface.xdg_surface,
                               XDG_SURFACE_ERROR_NOT_CONSTRUCTED,
                               "xdg_surface committed before it got a role");
        return signal_action_t::eOk;
      }

      if (!configured && surface.buffer) {
        wl_resource_post_error(surface.xdg_surface,
                               XDG_SURFACE_ERROR_UNCONFIGURED_BUFFER,
                               "Buffer committed before the first configure was acked");
      }
      return signal_action_t::eOk;
    });
  }

  xdg_surface_t::~xdg_surface_t() {
    if (auto binding = wm_base.lock(); binding && binding->surfaces > 0)
      binding->surfaces--;

    if (auto base = surface.lock(); base) {
      base->events.on_commit.disconnect(on_commit);
      base->xdg_surface = nullptr;
    }
  }

  void
  xdg_surface_t::post_wm_base_error(wl_resource *self, uint32_t code, const char *message) {
    auto binding = wm_base.lock();
    wl_resource_post_error(binding && binding->resource() ? binding->resource() : self, code, "%s", message);
  }
}

void
xdg_surface_destroy(wl_client *, wl_resource *xdg_surface) {
  auto surface = from_wl_resource<xdg_surface_t>(xdg_surface);
  if (surface->role_object) {
    wl_resource_post_error(xdg_surface,
                           XDG_SURFACE_ERROR_DEFUNCT_ROLE_OBJECT,
                           "xdg_surface destroyed before its role object");
    return;
  }
  wl_resource_destroy(xdg_surface);
}

void
xdg_surface_get_toplevel(wl_client *client, wl_resource *xdg_surface, uint32_t id) {
  auto xdg     = from_wl_resource<xdg_surface_t>(xdg_surface);
  auto surface = xdg->surface.lock();
  if (!surface)
    return;

  if (xdg->role != xdg_role_t::eNone) {
    wl_resource_post_error(
      xdg_surface, XDG_SURFACE_ERROR_ALREADY_CONSTRUCTED, "xdg_surface already has a role object");
    return;
  }

  if (!surface->set_role(surface_role_t::eXdgToplevel)) {
    xdg->post_wm_base_error(xdg_surface, XDG_WM_BASE_ERROR_ROLE, "Surface already has another role");
    return;
  }

  auto toplevel = make_resource<xdg_toplevel_t>(
    client, xdg_toplevel_interface, xdg_toplevel_impl, wl_resource_get_version(xdg_surface), id, xdg);
  if (!toplevel)
    return;

  xdg->role            = xdg_role_t::eToplevel;
  xdg->role_object     = toplevel->resource();
  surface->role_object = toplevel->resource();

  std::weak_ptr<resource_t<xdg_surface_t>> weak_xdg = xdg;
  toplevel->on_destroy.connect([weak_xdg](wl_resource *) {
    auto xdg = weak_xdg.lock();
    if (!xdg)
      return signal_action_t::eOk;

    xdg->role_object = nullptr;
    if (auto surface = xdg->surface.lock(); surface)
      xdg->server.retire_role(*surface);
    return signal_action_t::eOk;
  });

  surface->server.shell().new_toplevel(surface->id);
}

void
xdg_surface_get_popup(wl_client   *client,
                      wl_resource *xdg_surface,
                      uint32_t     id,
                      wl_resource *parent,
                      wl_resource *positioner) {
  auto xdg     = from_wl_resource<xdg_surface_t>(xdg_surface);
  auto surface = xdg->surface.lock();
  if (!surface)
    return;

  if (xdg->role != xdg_role_t::eNone) {
    wl_resource_post_error(
      xdg_surface, XDG_SURFACE_ERROR_ALREADY_CONSTRUCTED, "xdg_surface already has a role object");
    return;
  }

  auto rules = from_wl_resource<xdg_positioner_t>(positioner);
  if (!rules->state.is_complete()) {
    xdg->post_wm_base_error(xdg_surface,
                            XDG_WM_BASE_ERROR_INVALID_POSITIONER,
                            "Positioner needs both a size and an anchor rect");
    return;
  }

  // A null parent is only valid when the popup gets parented later
  // through zwlr_layer_surface_v1.get_popup.
  resource_ptr_t<surface_t> parent_surface;
  if (parent) {
    auto parent_xdg = from_wl_resource<xdg_surface_t>(parent);
    parent_surface  = parent_xdg ? parent_xdg->surface.lock() : nullptr;
    if (!parent_surface || parent_xdg->role == xdg_role_t::eNone) {
      xdg->post_wm_base_error(
        xdg_surface, XDG_WM_BASE_ERROR_INVALID_POPUP_PARENT, "Popup parent has no role");
      return;
    }
  }

  if (!surface->set_role(surface_role_t::eXdgPopup)) {
    xdg->post_wm_base_error(xdg_surface, XDG_WM_BASE_ERROR_ROLE, "Surface already has another role");
    return;
  }

  auto popup = make_resource<xdg_popup_t>(client,
                                          xdg_popup_interface,
                                          xdg_popup_impl,
                                          wl_resource_get_version(xdg_surface),
                                          id,
                                          xdg,
                                          rules->state);
  if (!popup)
    return;

  popup->parent        = parent_surface;
  xdg->role            = xdg_role_t::ePopup;
  xdg->role_object     = popup->resource();
  surface->role_object = popup->resource();

  std::weak_ptr<resource_t<xdg_surface_t>> weak_xdg = xdg;
  popup->on_destroy.connect([weak_xdg](wl_resource *) {
    auto xdg = weak_xdg.lock();
    if (!xdg)
      return signal_action_t::eOk;

    xdg->role_object = nullptr;
    if (auto surface = xdg->surface.lock(); surface)
      xdg->server.retire_role(*surface);
    return signal_action_t::eOk;
  });

  if (parent_surface)
    surface->server.shell().new_popup(surface->id, parent_surface->id, popup->positioner);
}

void
xdg_surface_set_window_geometry(wl_client   *,
                                wl_resource *xdg_surface,
                                int32_t      x,
                                int32_t      y,
                                int32_t      width,
                                int32_t      height) {
  if (width <= 0 || height <= 0) {
    wl_resource_post_error(xdg_surface,
                           XDG_SURFACE_ERROR_INVALID_SIZE,
                           "Window geometry %dx%d is not positive",
                           width,
                           height);
    return;
  }

  auto xdg              = from_wl_resource<xdg_surface_t>(xdg_surface);
  xdg->pending_geometry = region_t{ x, y, width, height };
}

void
xdg_surface_ack_configure(wl_client *, wl_resource *xdg_surface, uint32_t serial) {
  auto xdg = from_wl_resource<xdg_surface_t>(xdg_surface);

  if (!xdg->pending_serials.ack(serial)) {
    wl_resource_post_error(
      xdg_surface, XDG_SURFACE_ERROR_INVALID_SERIAL, "Serial %u was never sent", serial);
    return;
  }
  xdg->configured = true;

  if (auto surface = xdg->surface.lock(); surface)
    surface->server.shell().ack_configure(surface->id, serial);
}

const struct xdg_surface_interface xdg_surface_impl = {
  .destroy             = xdg_surface_destroy,
  .get_toplevel        = xdg_surface_get_toplevel,
  .get_popup           = xdg_surface_get_popup,
  .set_window_geometry = xdg_surface_set_window_geometry,
  .ack_configure       = xdg_surface_ack_configure,
};
