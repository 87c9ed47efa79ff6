#include "basalt/wayland/server.hpp"
#include "basalt/wayland/xdg_shell.hpp"

#include "../log.hpp"
#include "wl/xdg-shell-protocol.h"

#include <algorithm>
#include <stdexcept>
#include <wayland-server-core.h>

using namespace basalt;
using namespace basalt::wayland;

void
xdg_wm_base_destroy(wl_client *, wl_resource *);

void
xdg_wm_base_create_positioner(wl_client *client, wl_resource *xdg_wm_base, uint32_t id);

void
xdg_wm_base_get_xdg_surface(wl_client   *client,
                            wl_resource *xdg_wm_base,
                            uint32_t     id,
                            wl_resource *wl_surface);

void
xdg_wm_base_pong(wl_client *, wl_resource *, uint32_t);

const struct xdg_wm_base_interface xdg_wm_base_impl = {
  .destroy           = xdg_wm_base_destroy,
  .create_positioner = xdg_wm_base_create_positioner,
  .get_xdg_surface   = xdg_wm_base_get_xdg_surface,
  .pong              = xdg_wm_base_pong,
};

namespace basalt::wayland {

  xdg_wm_base_t::xdg_wm_base_t(server_t &server, uint32_t version)
    : server(server) {
    version = std::clamp(version, 1u, MAX_VERSION);
    global  = wl_global_create(
      server.display(), &xdg_wm_base_interface, static_cast<int>(version), this, bind);
    if (!global)
      throw std::runtime_error("Failed to create the xdg_wm_base global");
  }

  xdg_wm_base_t::~xdg_wm_base_t() {
    wl_global_destroy(global);
  }

  void
  xdg_wm_base_t::bind(wl_client *client, void *ud, uint32_t version, uint32_t id) {
    auto *shell = static_cast<xdg_wm_base_t *>(ud);
    make_resource<xdg_wm_base_binding_t>(
      client, xdg_wm_base_interface, xdg_wm_base_impl, version, id, *shell);
  }
}

void
xdg_wm_base_destroy(wl_client *, wl_resource *res) {
  auto binding = from_wl_resource<xdg_wm_base_binding_t>(res);
  if (binding->surfaces > 0) {
    wl_resource_post_error(res,
                           XDG_WM_BASE_ERROR_DEFUNCT_SURFACES,
                           "xdg_wm_base destroyed while %u xdg_surfaces are alive",
                           binding->surfaces);
    return;
  }
  wl_resource_destroy(res);
}

void
xdg_wm_base_create_positioner(wl_client *client, wl_resource *xdg_wm_base, uint32_t id) {
  make_resource<xdg_positioner_t>(
    client, xdg_positioner_interface, xdg_positioner_impl, wl_resource_get_version(xdg_wm_base), id);
}

void
xdg_wm_base_get_xdg_surface(wl_client   *client,
                            wl_resource *xdg_wm_base,
                            uint32_t     id,
                            wl_resource *wl_surface) {
  auto binding = from_wl_resource<xdg_wm_base_binding_t>(xdg_wm_base);
  auto surface = from_wl_resource<surface_t>(wl_surface);

  if (surface->role != surface_role_t::eNone && surface->role != surface_role_t::eXdgToplevel &&
      surface->role != surface_role_t::eXdgPopup) {
    wl_resource_post_error(xdg_wm_base,
                           XDG_WM_BASE_ERROR_ROLE,
                           "Surface already has the %s role",
                           to_string(surface->role));
    return;
  }

  if (surface->xdg_surface) {
    wl_resource_post_error(
      xdg_wm_base, XDG_SURFACE_ERROR_ALREADY_CONSTRUCTED, "Surface already has an xdg_surface");
    return;
  }

  // Creating an xdg_surface from a wl_surface which has a buffer
  // attached or committed is a client error.
  if (surface->size || surface->staging.buffer) {
    wl_resource_post_error(xdg_wm_base,
                           XDG_SURFACE_ERROR_UNCONFIGURED_BUFFER,
                           "Surface has a buffer attached before getting an xdg_surface");
    return;
  }

  auto xdg_surface = make_resource<xdg_surface_t>(client,
                                                  xdg_surface_interface,
                                                  xdg_surface_impl,
                                                  wl_resource_get_version(xdg_wm_base),
                                                  id,
                                                  binding->shell.server,
                                                  surface,
                                                  binding);
  if (!xdg_surface)
    return;

  surface->xdg_surface = xdg_surface->resource();
}

void
xdg_wm_base_pong(wl_client *, wl_resource *, uint32_t) {
  // Pings are never sent.
}
