#include "basalt/wayland/server.hpp"
#include "basalt/wayland/xdg_shell.hpp"

#include "../log.hpp"
#include "wl/xdg-shell-protocol.h"

#include <wayland-server-core.h>

using namespace basalt;
using namespace basalt::wayland;

void
xdg_popup_destroy(wl_client *, wl_resource *xdg_popup) {
  wl_resource_destroy(xdg_popup);
}

void
xdg_popup_grab(wl_client *, wl_resource *xdg_popup, wl_resource *, uint32_t serial) {
  auto popup = from_wl_resource<xdg_popup_t>(xdg_popup);
  auto xdg   = popup->xdg_surface.lock();
  if (!xdg)
    return;

  if (auto surface = xdg->surface.lock(); surface)
    surface->server.shell().popup_grab_request(surface->id, 0, serial);
}

void
xdg_popup_reposition(wl_client *, wl_resource *xdg_popup, wl_resource *positioner, uint32_t token) {
  auto popup = from_wl_resource<xdg_popup_t>(xdg_popup);
  auto rules = from_wl_resource<xdg_positioner_t>(positioner);
  if (!rules->state.is_complete()) {
    wl_resource_post_error(xdg_popup,
                           XDG_WM_BASE_ERROR_INVALID_POSITIONER,
                           "Positioner needs both a size and an anchor rect");
    return;
  }

  popup->positioner = rules->state;

  auto xdg = popup->xdg_surface.lock();
  if (!xdg)
    return;
  auto surface = xdg->surface.lock();
  if (!surface)
    return;

  // `repositioned` precedes the configure carrying the new geometry.
  if (xdg->configured)
    xdg_popup_send_repositioned(xdg_popup, token);

  surface->server.shell().reposition_popup(surface->id, popup->positioner);
}

const struct xdg_popup_interface xdg_popup_impl = {
  .destroy    = xdg_popup_destroy,
  .grab       = xdg_popup_grab,
  .reposition = xdg_popup_reposition,
};
