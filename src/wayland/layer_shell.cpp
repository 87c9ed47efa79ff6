#include "basalt/wayland/layer_shell.hpp"
#include "basalt/wayland/server.hpp"
#include "basalt/wayland/xdg_shell.hpp"

#include "../log.hpp"
#include "wl/wlr-layer-shell-unstable-v1-protocol.h"

#include <algorithm>
#include <stdexcept>
#include <wayland-server-core.h>

using namespace basalt;
using namespace basalt::wayland;

void
zwlr_layer_shell_v1_get_layer_surface(wl_client   *client,
                                      wl_resource *layer_shell,
                                      uint32_t     id,
                                      wl_resource *wl_surface,
                                      wl_resource *output,
                                      uint32_t     layer,
                                      const char  *namespace_);

void
zwlr_layer_shell_v1_destroy(wl_client *, wl_resource *layer_shell);

const struct zwlr_layer_shell_v1_interface zwlr_layer_shell_v1_impl = {
  .get_layer_surface = zwlr_layer_shell_v1_get_layer_surface,
  .destroy           = zwlr_layer_shell_v1_destroy,
};

namespace basalt::wayland {
  namespace {
    constexpr uint32_t HORIZONTAL =
      ZWLR_LAYER_SURFACE_V1_ANCHOR_LEFT | ZWLR_LAYER_SURFACE_V1_ANCHOR_RIGHT;
    constexpr uint32_t VERTICAL =
      ZWLR_LAYER_SURFACE_V1_ANCHOR_TOP | ZWLR_LAYER_SURFACE_V1_ANCHOR_BOTTOM;
    constexpr uint32_t ALL_ANCHORS = HORIZONTAL | VERTICAL;
  }

  layer_shell_t::layer_shell_t(server_t &server, uint32_t version)
    : server(server) {
    version = std::clamp(version, 1u, MAX_VERSION);
    global  = wl_global_create(
      server.display(), &zwlr_layer_shell_v1_interface, static_cast<int>(version), this, bind);
    if (!global)
      throw std::runtime_error("Failed to create the zwlr_layer_shell_v1 global");
  }

  layer_shell_t::~layer_shell_t() {
    wl_global_destroy(global);
  }

  void
  layer_shell_t::bind(wl_client *client, void *ud, uint32_t version, uint32_t id) {
    struct wl_resource *resource =
      wl_resource_create(client, &zwlr_layer_shell_v1_interface, static_cast<int>(version), id);
    if (!resource) {
      wl_client_post_no_memory(client);
      return;
    }

    wl_resource_set_implementation(resource, &zwlr_layer_shell_v1_impl, ud, nullptr);
  }

  layer_surface_t::layer_surface_t(server_t &server, resource_ptr_t<surface_t> base, layer_t layer)
    : server(server)
    , surface(base) {
    pending.layer = layer;
    current.layer = layer;

    on_commit = base->events.on_commit.connect([this](surface_t &surface) {
      // A zero size is only allowed along an axis anchored on both
      // sides; the compositor picks the size then.
      if ((pending.size.x == 0 && (pending.anchor & HORIZONTAL) != HORIZONTAL) ||
          (pending.size.y == 0 && (pending.anchor & VERTICAL) != VERTICAL)) {
        wl_resource_post_error(surface.role_object,
                               ZWLR_LAYER_SURFACE_V1_ERROR_INVALID_SIZE,
                               "Zero size %dx%d requires anchoring to opposite edges",
                               pending.size.x,
                               pending.size.y);
        return signal_action_t::eOk;
      }

      current = pending;
      this->server.shell().commit_layer_state(surface.id, current);
      return signal_action_t::eOk;
    });
  }

  layer_surface_t::~layer_surface_t() {
    if (auto base = surface.lock(); base)
      base->events.on_commit.disconnect(on_commit);
  }
}

void
zwlr_layer_shell_v1_get_layer_surface(wl_client   *client,
                                      wl_resource *layer_shell,
                                      uint32_t     id,
                                      wl_resource *wl_surface,
                                      wl_resource *,
                                      uint32_t     layer,
                                      const char  *namespace_) {
  auto *shell   = static_cast<layer_shell_t *>(wl_resource_get_user_data(layer_shell));
  auto  surface = from_wl_resource<surface_t>(wl_surface);

  auto value = layer_from_wire(layer);
  if (!value) {
    wl_resource_post_error(
      layer_shell, ZWLR_LAYER_SHELL_V1_ERROR_INVALID_LAYER, "Invalid layer %u", layer);
    return;
  }

  if (surface->role_object || surface->xdg_surface) {
    wl_resource_post_error(layer_shell,
                           ZWLR_LAYER_SHELL_V1_ERROR_ALREADY_CONSTRUCTED,
                           "Surface already has a role object");
    return;
  }

  if (!surface->set_role(surface_role_t::eLayerSurface)) {
    wl_resource_post_error(layer_shell,
                           ZWLR_LAYER_SHELL_V1_ERROR_ROLE,
                           "Surface already has the %s role",
                           to_string(surface->role));
    return;
  }

  auto layer_surface = make_resource<layer_surface_t>(client,
                                                      zwlr_layer_surface_v1_interface,
                                                      zwlr_layer_surface_v1_impl,
                                                      wl_resource_get_version(layer_shell),
                                                      id,
                                                      shell->server,
                                                      surface,
                                                      *value);
  if (!layer_surface)
    return;

  surface->role_object = layer_surface->resource();

  std::weak_ptr<resource_t<surface_t>> weak_surface = surface;
  layer_surface->on_destroy.connect([weak_surface](wl_resource *) {
    if (auto surface = weak_surface.lock(); surface)
      surface->server.retire_role(*surface);
    return signal_action_t::eOk;
  });

  // Outputs are not advertised; the compositor always picks.
  shell->server.shell().new_layer_surface(
    surface->id, std::nullopt, *value, namespace_ ? namespace_ : "");
}

void
zwlr_layer_shell_v1_destroy(wl_client *, wl_resource *layer_shell) {
  wl_resource_destroy(layer_shell);
}

void
zwlr_layer_surface_v1_set_size(wl_client *, wl_resource *resource, uint32_t width, uint32_t height) {
  auto layer          = from_wl_resource<layer_surface_t>(resource);
  layer->pending.size = { static_cast<int32_t>(width), static_cast<int32_t>(height) };
}

void
zwlr_layer_surface_v1_set_anchor(wl_client *, wl_resource *resource, uint32_t anchor) {
  if (anchor > ALL_ANCHORS) {
    wl_resource_post_error(
      resource, ZWLR_LAYER_SURFACE_V1_ERROR_INVALID_ANCHOR, "Invalid anchor %u", anchor);
    return;
  }
  from_wl_resource<layer_surface_t>(resource)->pending.anchor = anchor;
}

void
zwlr_layer_surface_v1_set_exclusive_zone(wl_client *, wl_resource *resource, int32_t zone) {
  from_wl_resource<layer_surface_t>(resource)->pending.exclusive_zone = zone;
}

void
zwlr_layer_surface_v1_set_margin(
  wl_client *, wl_resource *resource, int32_t top, int32_t right, int32_t bottom, int32_t left) {
  auto layer            = from_wl_resource<layer_surface_t>(resource);
  layer->pending.margin = { .top = top, .right = right, .bottom = bottom, .left = left };
}

void
zwlr_layer_surface_v1_set_keyboard_interactivity(wl_client   *,
                                                 wl_resource *resource,
                                                 uint32_t     interactivity) {
  // on_demand arrived with version 4.
  uint32_t max = wl_resource_get_version(resource) >= 4
                   ? ZWLR_LAYER_SURFACE_V1_KEYBOARD_INTERACTIVITY_ON_DEMAND
                   : ZWLR_LAYER_SURFACE_V1_KEYBOARD_INTERACTIVITY_EXCLUSIVE;
  if (interactivity > max) {
    wl_resource_post_error(resource,
                           ZWLR_LAYER_SURFACE_V1_ERROR_INVALID_KEYBOARD_INTERACTIVITY,
                           "Invalid keyboard interactivity %u",
                           interactivity);
    return;
  }
  from_wl_resource<layer_surface_t>(resource)->pending.keyboard_interactivity = interactivity;
}

void
zwlr_layer_surface_v1_get_popup(wl_client *, wl_resource *resource, wl_resource *xdg_popup) {
  auto layer   = from_wl_resource<layer_surface_t>(resource);
  auto popup   = from_wl_resource<xdg_popup_t>(xdg_popup);
  auto surface = layer->surface.lock();
  auto xdg     = popup->xdg_surface.lock();
  if (!surface || !xdg)
    return;

  auto popup_surface = xdg->surface.lock();
  if (!popup_surface)
    return;

  if (!popup->parent.expired()) {
    WARN("{} already has a parent, ignoring get_popup from {}", popup_surface->id, surface->id);
    return;
  }

  popup->parent = surface;
  surface->server.shell().new_popup(popup_surface->id, surface->id, popup->positioner);
}

void
zwlr_layer_surface_v1_ack_configure(wl_client *, wl_resource *resource, uint32_t serial) {
  auto layer = from_wl_resource<layer_surface_t>(resource);
  if (auto surface = layer->surface.lock(); surface)
    surface->server.shell().layer_ack_configure(surface->id, serial);
}

void
zwlr_layer_surface_v1_destroy(wl_client *, wl_resource *resource) {
  wl_resource_destroy(resource);
}

void
zwlr_layer_surface_v1_set_layer(wl_client *, wl_resource *resource, uint32_t layer) {
  auto value = layer_from_wire(layer);
  if (!value) {
    wl_resource_post_error(
      resource, ZWLR_LAYER_SHELL_V1_ERROR_INVALID_LAYER, "Invalid layer %u", layer);
    return;
  }
  from_wl_resource<layer_surface_t>(resource)->pending.layer = *value;
}

const struct zwlr_layer_surface_v1_interface zwlr_layer_surface_v1_impl = {
  .set_size                   = zwlr_layer_surface_v1_set_size,
  .set_anchor                 = zwlr_layer_surface_v1_set_anchor,
  .set_exclusive_zone         = zwlr_layer_surface_v1_set_exclusive_zone,
  .set_margin                 = zwlr_layer_surface_v1_set_margin,
  .set_keyboard_interactivity = zwlr_layer_surface_v1_set_keyboard_interactivity,
  .get_popup                  = zwlr_layer_surface_v1_get_popup,
  .ack_configure              = zwlr_layer_surface_v1_ack_configure,
  .destroy                    = zwlr_layer_surface_v1_destroy,
  .set_layer                  = zwlr_layer_surface_v1_set_layer,
};
