#include "basalt/wayland/xdg_shell.hpp"

#include "../log.hpp"
#include "wl/xdg-shell-protocol.h"

#include <wayland-server-core.h>

using namespace basalt;
using namespace basalt::wayland;

void
xdg_positioner_destroy(wl_client *, wl_resource *xdg_positioner) {
  wl_resource_destroy(xdg_positioner);
}

void
xdg_positioner_set_size(wl_client *, wl_resource *xdg_positioner, int32_t width, int32_t height) {
  if (width <= 0 || height <= 0) {
    wl_resource_post_error(
      xdg_positioner, XDG_POSITIONER_ERROR_INVALID_INPUT, "Positioner size must be positive");
    return;
  }

  auto positioner        = from_wl_resource<xdg_positioner_t>(xdg_positioner);
  positioner->state.size = { width, height };
}

void
xdg_positioner_set_anchor_rect(wl_client   *,
                               wl_resource *xdg_positioner,
                               int32_t      x,
                               int32_t      y,
                               int32_t      width,
                               int32_t      height) {
  if (width < 0 || height < 0) {
    wl_resource_post_error(xdg_positioner,
                           XDG_POSITIONER_ERROR_INVALID_INPUT,
                           "Anchor rect size must not be negative");
    return;
  }

  auto positioner                   = from_wl_resource<xdg_positioner_t>(xdg_positioner);
  positioner->state.anchor_rect     = region_t{ x, y, width, height };
  positioner->state.has_anchor_rect = true;
}

void
xdg_positioner_set_anchor(wl_client *, wl_resource *xdg_positioner, uint32_t anchor) {
  auto value = anchor_from_wire(anchor);
  if (!value) {
    wl_resource_post_error(
      xdg_positioner, XDG_POSITIONER_ERROR_INVALID_INPUT, "Invalid anchor %u", anchor);
    return;
  }

  from_wl_resource<xdg_positioner_t>(xdg_positioner)->state.anchor = *value;
}

void
xdg_positioner_set_gravity(wl_client *, wl_resource *xdg_positioner, uint32_t gravity) {
  auto value = gravity_from_wire(gravity);
  if (!value) {
    wl_resource_post_error(
      xdg_positioner, XDG_POSITIONER_ERROR_INVALID_INPUT, "Invalid gravity %u", gravity);
    return;
  }

  from_wl_resource<xdg_positioner_t>(xdg_positioner)->state.gravity = *value;
}

void
xdg_positioner_set_constraint_adjustment(wl_client *, wl_resource *xdg_positioner, uint32_t adjustment) {
  from_wl_resource<xdg_positioner_t>(xdg_positioner)->state.constraint_adjustment = adjustment;
}

void
xdg_positioner_set_offset(wl_client *, wl_resource *xdg_positioner, int32_t x, int32_t y) {
  from_wl_resource<xdg_positioner_t>(xdg_positioner)->state.offset = { x, y };
}

void
xdg_positioner_set_reactive(wl_client *, wl_resource *xdg_positioner) {
  from_wl_resource<xdg_positioner_t>(xdg_positioner)->state.reactive = true;
}

void
xdg_positioner_set_parent_size(wl_client *, wl_resource *xdg_positioner, int32_t width, int32_t height) {
  from_wl_resource<xdg_positioner_t>(xdg_positioner)->state.parent_size = ipoint_t{ width, height };
}

void
xdg_positioner_set_parent_configure(wl_client *, wl_resource *xdg_positioner, uint32_t serial) {
  from_wl_resource<xdg_positioner_t>(xdg_positioner)->state.parent_configure = serial;
}

const struct xdg_positioner_interface xdg_positioner_impl = {
  .destroy                   = xdg_positioner_destroy,
  .set_size                  = xdg_positioner_set_size,
  .set_anchor_rect           = xdg_positioner_set_anchor_rect,
  .set_anchor                = xdg_positioner_set_anchor,
  .set_gravity               = xdg_positioner_set_gravity,
  .set_constraint_adjustment = xdg_positioner_set_constraint_adjustment,
  .set_offset                = xdg_positioner_set_offset,
  .set_reactive              = xdg_positioner_set_reactive,
  .set_parent_size           = xdg_positioner_set_parent_size,
  .set_parent_configure      = xdg_positioner_set_parent_configure,
};
