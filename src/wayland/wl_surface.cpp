#include "basalt/wayland/surface.hpp"
#include "basalt/wayland/server.hpp"

#include "../log.hpp"

#include <algorithm>
#include <utility>
#include <wayland-server-core.h>
#include <wayland-server-protocol.h>

using namespace basalt;
using namespace basalt::wayland;

namespace basalt::wayland {
  buffer_ref_t::buffer_ref_t(wl_resource *buffer)
    : buffer(buffer) {
    on_destroy.notify = [](wl_listener *listener, void *) {
      buffer_ref_t *self = wl_container_of(listener, self, on_destroy);
      self->buffer       = nullptr;
      wl_list_remove(&listener->link);
      wl_list_init(&listener->link);
    };
    wl_resource_add_destroy_listener(buffer, &on_destroy);
  }

  buffer_ref_t::~buffer_ref_t() {
    wl_list_remove(&on_destroy.link);
  }

  void
  surface_state_t::merge(surface_state_t &&newer) {
    if (newer.attached) {
      attached = true;
      buffer   = std::move(newer.buffer);
    }
    offset = newer.offset;
    if (newer.scale)
      scale = newer.scale;
    frame_callbacks.insert(
      frame_callbacks.end(), newer.frame_callbacks.begin(), newer.frame_callbacks.end());
  }

  const char *
  to_string(surface_role_t role) {
    switch (role) {
      case surface_role_t::eNone:
        return "none";
      case surface_role_t::eSubsurface:
        return "wl_subsurface";
      case surface_role_t::eXdgToplevel:
        return "xdg_toplevel";
      case surface_role_t::eXdgPopup:
        return "xdg_popup";
      case surface_role_t::eLayerSurface:
        return "zwlr_layer_surface_v1";
    }
    return "invalid";
  }

  surface_t::surface_t(server_t &server)
    : server(server) {}

  surface_t::~surface_t() {
    // Children outlive their parent as plain surfaces.
    for (auto &child : children) {
      if (auto surface = child->surface.lock())
        surface->subsurface = nullptr;
    }
  }

  bool
  surface_t::set_role(surface_role_t new_role) {
    if (role != surface_role_t::eNone && role != new_role)
      return false;
    role = new_role;
    return true;
  }

  bool
  surface_t::synchronized() const {
    // A subsurface in desync mode still behaves synchronized while any
    // of its ancestors is.
    const subsurface_t *current = subsurface.get();
    while (current) {
      if (current->sync)
        return true;

      auto parent = current->parent.lock();
      if (!parent)
        return false;
      current = parent->subsurface.get();
    }
    return false;
  }

  void
  surface_t::apply(surface_state_t &&state) {
    if (state.attached) {
      buffer = std::move(state.buffer);
      if (!buffer)
        size.reset();
    }
    if (state.scale)
      scale = *state.scale;
    frame_callbacks.insert(
      frame_callbacks.end(), state.frame_callbacks.begin(), state.frame_callbacks.end());

    for (auto &child : children) {
      child->position = child->pending_position;

      auto surface = child->surface.lock();
      if (!surface || !surface->has_cache || !surface->synchronized())
        continue;

      auto cached        = std::exchange(surface->cached, {});
      surface->has_cache = false;
      surface->apply(std::move(cached));
    }
  }

  void
  surface_t::forget_frame_callback(wl_resource *callback) {
    std::erase(staging.frame_callbacks, callback);
    std::erase(cached.frame_callbacks, callback);
    std::erase(frame_callbacks, callback);
  }
}

void
wl_surface_destroy(wl_client *, wl_resource *wl_surface) {
  wl_resource_destroy(wl_surface);
}

void
wl_surface_attach(wl_client   *client,
                  wl_resource *wl_surface,
                  wl_resource *wl_buffer,
                  int32_t      x,
                  int32_t      y) {
  auto surface = from_wl_resource<surface_t>(wl_surface);

  if (wl_resource_get_version(wl_surface) >= WL_SURFACE_OFFSET_SINCE_VERSION && (x != 0 || y != 0)) {
    wl_resource_post_error(wl_surface,
                           WL_SURFACE_ERROR_INVALID_OFFSET,
                           "Non-zero attach offset, use wl_surface.offset instead.");
    return;
  }

  // Buffers are double-buffered
  surface->staging.attached = true;
  surface->staging.offset   = { x, y };
  if (wl_buffer == nullptr) {
    TRACE("wl_surface#attach: removing buffer from {}", surface->id);
    surface->staging.buffer = nullptr;
    return;
  }

  surface->staging.buffer = std::make_shared<buffer_ref_t>(wl_buffer);
}

void
wl_surface_damage(wl_client *, wl_resource *, int32_t, int32_t, int32_t, int32_t) {
  // Nothing is drawn, damage is irrelevant.
}

void
wl_surface_frame(wl_client *client, wl_resource *wl_surface, uint32_t callback) {
  auto surface = from_wl_resource<surface_t>(wl_surface);

  wl_resource *callback_res = wl_resource_create(client, &wl_callback_interface, 1, callback);
  if (!callback_res) {
    wl_client_post_no_memory(client);
    return;
  }

  auto weak = new std::weak_ptr<resource_t<surface_t>>(surface);
  wl_resource_set_implementation(callback_res, nullptr, weak, [](wl_resource *res) {
    auto *weak_surface =
      static_cast<std::weak_ptr<resource_t<surface_t>> *>(wl_resource_get_user_data(res));
    if (auto surface = weak_surface->lock(); surface)
      surface->forget_frame_callback(res);
    delete weak_surface;
  });

  surface->staging.frame_callbacks.push_back(callback_res);
}

void
wl_surface_set_opaque_region(wl_client *, wl_resource *, wl_resource *) {}

void
wl_surface_set_input_region(wl_client *, wl_resource *, wl_resource *) {}

void
wl_surface_commit(wl_client *, wl_resource *wl_surface) {
  auto surface = from_wl_resource<surface_t>(wl_surface);

  auto state = std::exchange(surface->staging, {});
  if (surface->synchronized()) {
    // Held back until the parent commits.
    surface->cached.merge(std::move(state));
    surface->has_cache = true;
  } else {
    surface->apply(std::move(state));
  }

  surface->events.on_commit.emit(*surface);
  surface->server.shell().commit(surface->id);
}

void
wl_surface_set_buffer_transform(wl_client *, wl_resource *wl_surface, int32_t transform) {
  if (transform < WL_OUTPUT_TRANSFORM_NORMAL || transform > WL_OUTPUT_TRANSFORM_FLIPPED_270) {
    wl_resource_post_error(
      wl_surface, WL_SURFACE_ERROR_INVALID_TRANSFORM, "Invalid buffer transform %d", transform);
  }
}

void
wl_surface_set_buffer_scale(wl_client *, wl_resource *wl_surface, int32_t scale) {
  if (scale < 1) {
    wl_resource_post_error(wl_surface, WL_SURFACE_ERROR_INVALID_SCALE, "Buffer scale must be >= 1");
    return;
  }

  auto surface           = from_wl_resource<surface_t>(wl_surface);
  surface->staging.scale = scale;
}

void
wl_surface_damage_buffer(wl_client *, wl_resource *, int32_t, int32_t, int32_t, int32_t) {}

void
wl_surface_offset(wl_client *, wl_resource *wl_surface, int32_t x, int32_t y) {
  auto surface            = from_wl_resource<surface_t>(wl_surface);
  surface->staging.offset = { x, y };
}

const struct wl_surface_interface wl_surface_impl = {
  .destroy              = wl_surface_destroy,
  .attach               = wl_surface_attach,
  .damage               = wl_surface_damage,
  .frame                = wl_surface_frame,
  .set_opaque_region    = wl_surface_set_opaque_region,
  .set_input_region     = wl_surface_set_input_region,
  .commit               = wl_surface_commit,
  .set_buffer_transform = wl_surface_set_buffer_transform,
  .set_buffer_scale     = wl_surface_set_buffer_scale,
  .damage_buffer        = wl_surface_damage_buffer,
  .offset               = wl_surface_offset,
};
