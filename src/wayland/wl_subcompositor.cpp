#include "basalt/wayland/wl_subcompositor.hpp"
#include "basalt/wayland/resource.hpp"
#include "basalt/wayland/server.hpp"
#include "basalt/wayland/surface.hpp"

#include "../log.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <wayland-server-core.h>
#include <wayland-server-protocol.h>

using namespace basalt;
using namespace basalt::wayland;

void
wl_subcompositor_destroy(wl_client *, wl_resource *);

void
wl_subcompositor_get_subsurface(wl_client *, wl_resource *, uint32_t, wl_resource *, wl_resource *);

const struct wl_subcompositor_interface wl_subcompositor_impl{
  .destroy        = wl_subcompositor_destroy,
  .get_subsurface = wl_subcompositor_get_subsurface,
};

namespace {
  /// Detach `subsurface` from its parent's child list.
  void
  unlink(subsurface_t &subsurface) {
    if (auto parent = subsurface.parent.lock(); parent) {
      std::erase_if(parent->children,
                    [&](const auto &child) { return child.get() == &subsurface; });
    }
    if (auto surface = subsurface.surface.lock(); surface) {
      if (surface->subsurface.get() == &subsurface)
        surface->subsurface = nullptr;
    }
  }

  /// Move `subsurface` directly above or below `sibling` in the parent's
  /// stacking order. Returns false when `sibling` is neither the
  /// parent nor one of its children.
  bool
  restack(subsurface_t &subsurface, wl_resource *sibling_res, bool above) {
    auto parent  = subsurface.parent.lock();
    auto sibling = from_wl_resource<surface_t>(sibling_res);
    if (!parent || !sibling)
      return false;

    auto &children = parent->children;
    auto  self     = std::find_if(
      children.begin(), children.end(), [&](const auto &c) { return c.get() == &subsurface; });
    if (self == children.end())
      return false;

    auto entry = *self;
    children.erase(self);

    // Children below the parent are not told apart from the ones right
    // above it, both go to the bottom of the stack.
    if (sibling.get() == parent.get()) {
      children.insert(children.begin(), entry);
      return true;
    }

    auto it = std::find_if(children.begin(), children.end(), [&](const auto &c) {
      return c->surface.lock() == sibling;
    });
    if (it == children.end()) {
      children.push_back(entry);
      return false;
    }

    children.insert(above ? std::next(it) : it, entry);
    return true;
  }
}

void
wl_subsurface_destroy(wl_client *, wl_resource *wl_subsurface) {
  wl_resource_destroy(wl_subsurface);
}

void
wl_subsurface_set_position(wl_client *, wl_resource *wl_subsurface, int32_t x, int32_t y) {
  // Applied on the parent's next commit.
  auto subsurface              = from_wl_resource<subsurface_t>(wl_subsurface);
  subsurface->pending_position = { x, y };
}

void
wl_subsurface_place_above(wl_client *, wl_resource *wl_subsurface, wl_resource *sibling) {
  auto subsurface = from_wl_resource<subsurface_t>(wl_subsurface);
  if (!restack(*subsurface, sibling, true))
    wl_resource_post_error(
      wl_subsurface, WL_SUBSURFACE_ERROR_BAD_SURFACE, "Sibling is not the parent or a sibling");
}

void
wl_subsurface_place_below(wl_client *, wl_resource *wl_subsurface, wl_resource *sibling) {
  auto subsurface = from_wl_resource<subsurface_t>(wl_subsurface);
  if (!restack(*subsurface, sibling, false))
    wl_resource_post_error(
      wl_subsurface, WL_SUBSURFACE_ERROR_BAD_SURFACE, "Sibling is not the parent or a sibling");
}

void
wl_subsurface_set_sync(wl_client *, wl_resource *wl_subsurface) {
  from_wl_resource<subsurface_t>(wl_subsurface)->sync = true;
}

void
wl_subsurface_set_desync(wl_client *, wl_resource *wl_subsurface) {
  auto subsurface  = from_wl_resource<subsurface_t>(wl_subsurface);
  subsurface->sync = false;

  // Leaving sync mode applies whatever was cached, unless an ancestor
  // still holds it back.
  auto surface = subsurface->surface.lock();
  if (surface && surface->has_cache && !surface->synchronized()) {
    auto cached        = std::exchange(surface->cached, {});
    surface->has_cache = false;
    surface->apply(std::move(cached));
  }
}

const struct wl_subsurface_interface wl_subsurface_impl{
  .destroy      = wl_subsurface_destroy,
  .set_position = wl_subsurface_set_position,
  .place_above  = wl_subsurface_place_above,
  .place_below  = wl_subsurface_place_below,
  .set_sync     = wl_subsurface_set_sync,
  .set_desync   = wl_subsurface_set_desync,
};

namespace basalt::wayland {

  wl_subcompositor_t::wl_subcompositor_t(server_t &server)
    : server(server) {
    global = wl_global_create(server.display(), &wl_subcompositor_interface, VERSION, this, bind);
    if (!global)
      throw std::runtime_error("Failed to create the wl_subcompositor global");
  }

  wl_subcompositor_t::~wl_subcompositor_t() {
    wl_global_destroy(global);
  }

  void
  wl_subcompositor_t::bind(wl_client *client,
                           void      *wl_subcompositor,
                           uint32_t   version,
                           uint32_t   id) {
    wl_resource *res =
      wl_resource_create(client, &wl_subcompositor_interface, static_cast<int>(version), id);
    if (!res) {
      wl_client_post_no_memory(client);
      return;
    }

    wl_resource_set_implementation(res, &wl_subcompositor_impl, wl_subcompositor, nullptr);
  }
}

void
wl_subcompositor_destroy(wl_client *, wl_resource *resource) {
  wl_resource_destroy(resource);
}

void
wl_subcompositor_get_subsurface(wl_client   *client,
                                wl_resource *wl_subcompositor,
                                uint32_t     id,
                                wl_resource *wl_surface,
                                wl_resource *parent) {
  // Create a sub-surface interface for the given surface, and
  // associate it with the given parent surface. This turns a plain
  // wl_surface into a sub-surface.
  auto child_surface  = from_wl_resource<surface_t>(wl_surface);
  auto parent_surface = from_wl_resource<surface_t>(parent);

  if (child_surface->subsurface) {
    wl_resource_post_error(
      wl_subcompositor, WL_SUBCOMPOSITOR_ERROR_BAD_SURFACE, "Surface already is a subsurface");
    return;
  }

  if (!child_surface->set_role(surface_role_t::eSubsurface)) {
    wl_resource_post_error(wl_subcompositor,
                           WL_SUBCOMPOSITOR_ERROR_BAD_SURFACE,
                           "Surface already has the %s role",
                           to_string(child_surface->role));
    return;
  }

  // The parent must not be the child itself or one of its descendants.
  for (auto ancestor = parent_surface; ancestor;) {
    if (ancestor == child_surface) {
      wl_resource_post_error(
        wl_subcompositor, WL_SUBCOMPOSITOR_ERROR_BAD_PARENT, "Parent is a descendant of the surface");
      return;
    }
    ancestor = ancestor->subsurface ? ancestor->subsurface->parent.lock() : nullptr;
  }

  auto wl_subsurface = make_resource<subsurface_t>(client,
                                                   wl_subsurface_interface,
                                                   wl_subsurface_impl,
                                                   wl_resource_get_version(wl_subcompositor),
                                                   id);
  if (!wl_subsurface)
    return;

  wl_subsurface->surface = child_surface;
  wl_subsurface->parent  = parent_surface;

  // New subsurfaces go on top of the parent's stack.
  parent_surface->children.push_back(wl_subsurface);
  child_surface->subsurface = wl_subsurface;

  wl_subsurface->on_destroy.connect([weak = std::weak_ptr(wl_subsurface)](wl_resource *) {
    if (auto subsurface = weak.lock(); subsurface)
      unlink(*subsurface);
    return signal_action_t::eDelete;
  });

  TRACE("{} is now a subsurface of {}", child_surface->id, parent_surface->id);
}
