#include "basalt/wayland/server.hpp"
#include "basalt/wayland/xdg_shell.hpp"

#include "../log.hpp"
#include "wl/xdg-shell-protocol.h"

#include <wayland-server-core.h>

using namespace basalt;
using namespace basalt::wayland;

namespace {
  /// The wl_surface behind an xdg_toplevel, null once either the
  /// xdg_surface or the wl_surface is gone.
  resource_ptr_t<surface_t>
  surface_of(const resource_ptr_t<xdg_toplevel_t> &toplevel) {
    auto xdg = toplevel->xdg_surface.lock();
    return xdg ? xdg->surface.lock() : nullptr;
  }

  resource_ptr_t<surface_t>
  surface_of(wl_resource *xdg_toplevel) {
    return surface_of(from_wl_resource<xdg_toplevel_t>(xdg_toplevel));
  }
}

void
xdg_toplevel_destroy(wl_client *, wl_resource *xdg_toplevel) {
  wl_resource_destroy(xdg_toplevel);
}

void
xdg_toplevel_set_parent(wl_client *, wl_resource *xdg_toplevel, wl_resource *parent) {
  auto toplevel = from_wl_resource<xdg_toplevel_t>(xdg_toplevel);
  if (!parent) {
    toplevel->parent.reset();
    return;
  }

  auto parent_toplevel = from_wl_resource<xdg_toplevel_t>(parent);
  for (auto ancestor = parent_toplevel; ancestor; ancestor = ancestor->parent.lock()) {
    if (ancestor == toplevel) {
      wl_resource_post_error(
        xdg_toplevel, XDG_TOPLEVEL_ERROR_INVALID_PARENT, "Parent would form a cycle");
      return;
    }
  }
  toplevel->parent = parent_toplevel;
}

void
xdg_toplevel_set_title(wl_client *, wl_resource *xdg_toplevel, const char *title) {
  from_wl_resource<xdg_toplevel_t>(xdg_toplevel)->title = title;
}

void
xdg_toplevel_set_app_id(wl_client *, wl_resource *xdg_toplevel, const char *app_id) {
  from_wl_resource<xdg_toplevel_t>(xdg_toplevel)->app_id = app_id;
}

void
xdg_toplevel_show_window_menu(wl_client   *,
                              wl_resource *xdg_toplevel,
                              wl_resource *,
                              uint32_t     serial,
                              int32_t      x,
                              int32_t      y) {
  if (auto surface = surface_of(xdg_toplevel); surface)
    surface->server.shell().show_window_menu_request(surface->id, 0, serial, { x, y });
}

void
xdg_toplevel_move(wl_client *, wl_resource *xdg_toplevel, wl_resource *, uint32_t serial) {
  if (auto surface = surface_of(xdg_toplevel); surface)
    surface->server.shell().move_request(surface->id, 0, serial);
}

void
xdg_toplevel_resize(
  wl_client *, wl_resource *xdg_toplevel, wl_resource *, uint32_t serial, uint32_t edges) {
  auto edge = resize_edge_from_wire(edges);
  if (!edge) {
    wl_resource_post_error(
      xdg_toplevel, XDG_TOPLEVEL_ERROR_INVALID_RESIZE_EDGE, "Invalid resize edge %u", edges);
    return;
  }

  if (auto surface = surface_of(xdg_toplevel); surface)
    surface->server.shell().resize_request(surface->id, 0, serial, *edge);
}

void
xdg_toplevel_set_max_size(wl_client *, wl_resource *xdg_toplevel, int32_t width, int32_t height) {
  if (width < 0 || height < 0) {
    wl_resource_post_error(
      xdg_toplevel, XDG_TOPLEVEL_ERROR_INVALID_SIZE, "Maximum size must not be negative");
    return;
  }
  from_wl_resource<xdg_toplevel_t>(xdg_toplevel)->max_size = { width, height };
}

void
xdg_toplevel_set_min_size(wl_client *, wl_resource *xdg_toplevel, int32_t width, int32_t height) {
  if (width < 0 || height < 0) {
    wl_resource_post_error(
      xdg_toplevel, XDG_TOPLEVEL_ERROR_INVALID_SIZE, "Minimum size must not be negative");
    return;
  }
  from_wl_resource<xdg_toplevel_t>(xdg_toplevel)->min_size = { width, height };
}

void
xdg_toplevel_set_maximized(wl_client *, wl_resource *xdg_toplevel) {
  if (auto surface = surface_of(xdg_toplevel); surface)
    surface->server.shell().maximize_request(surface->id);
}

void
xdg_toplevel_unset_maximized(wl_client *, wl_resource *xdg_toplevel) {
  if (auto surface = surface_of(xdg_toplevel); surface)
    surface->server.shell().unmaximize_request(surface->id);
}

void
xdg_toplevel_set_fullscreen(wl_client *, wl_resource *xdg_toplevel, wl_resource *) {
  // No wl_output global is advertised, any output is "let the
  // compositor choose".
  if (auto surface = surface_of(xdg_toplevel); surface)
    surface->server.shell().fullscreen_request(surface->id, std::nullopt);
}

void
xdg_toplevel_unset_fullscreen(wl_client *, wl_resource *xdg_toplevel) {
  if (auto surface = surface_of(xdg_toplevel); surface)
    surface->server.shell().unfullscreen_request(surface->id);
}

void
xdg_toplevel_set_minimized(wl_client *, wl_resource *xdg_toplevel) {
  if (auto surface = surface_of(xdg_toplevel); surface)
    surface->server.shell().minimize_request(surface->id);
}

const struct xdg_toplevel_interface xdg_toplevel_impl = {
  .destroy          = xdg_toplevel_destroy,
  .set_parent       = xdg_toplevel_set_parent,
  .set_title        = xdg_toplevel_set_title,
  .set_app_id       = xdg_toplevel_set_app_id,
  .show_window_menu = xdg_toplevel_show_window_menu,
  .move             = xdg_toplevel_move,
  .resize           = xdg_toplevel_resize,
  .set_max_size     = xdg_toplevel_set_max_size,
  .set_min_size     = xdg_toplevel_set_min_size,
  .set_maximized    = xdg_toplevel_set_maximized,
  .unset_maximized  = xdg_toplevel_unset_maximized,
  .set_fullscreen   = xdg_toplevel_set_fullscreen,
  .unset_fullscreen = xdg_toplevel_unset_fullscreen,
  .set_minimized    = xdg_toplevel_set_minimized,
};
