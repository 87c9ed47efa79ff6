#include "basalt/wayland/wl_compositor.hpp"
#include "basalt/core/region.hpp"
#include "basalt/wayland/resource.hpp"
#include "basalt/wayland/server.hpp"
#include "basalt/wayland/surface.hpp"

#include "../log.hpp"

#include <stdexcept>
#include <wayland-server-core.h>
#include <wayland-server-protocol.h>

using namespace basalt;
using namespace basalt::wayland;

void
wl_compositor_create_surface(wl_client *, wl_resource *, uint32_t);

void
wl_compositor_create_region(wl_client *, wl_resource *, uint32_t);

const struct wl_compositor_interface wl_compositor_impl = {
  .create_surface = &wl_compositor_create_surface,
  .create_region  = &wl_compositor_create_region,
};

namespace basalt::wayland {
  wl_compositor_t::wl_compositor_t(server_t &server)
    : server(server) {
    global = wl_global_create(server.display(), &wl_compositor_interface, VERSION, this, bind);
    if (!global)
      throw std::runtime_error("Failed to create the wl_compositor global");
  }

  wl_compositor_t::~wl_compositor_t() {
    wl_global_destroy(global);
  }

  void
  wl_compositor_t::bind(wl_client *client, void *ud, uint32_t version, uint32_t id) {
    struct wl_resource *resource =
      wl_resource_create(client, &wl_compositor_interface, static_cast<int>(version), id);
    if (!resource) {
      wl_client_post_no_memory(client);
      return;
    }

    wl_resource_set_implementation(resource, &wl_compositor_impl, ud, nullptr);
  }
}; // namespace basalt::wayland

void
wl_compositor_create_surface(wl_client *client, wl_resource *wl_compositor, uint32_t id) {
  auto *compositor = static_cast<wl_compositor_t *>(wl_resource_get_user_data(wl_compositor));
  auto &server     = compositor->server;

  auto surface = make_resource<surface_t>(client,
                                          wl_surface_interface,
                                          wl_surface_impl,
                                          wl_resource_get_version(wl_compositor),
                                          id,
                                          server);
  if (!surface)
    return;

  surface->id = server.register_surface(surface);
  surface->on_destroy.connect([&server, weak = std::weak_ptr(surface)](wl_resource *) {
    if (auto surface = weak.lock(); surface)
      server.unregister_surface(*surface);
    return signal_action_t::eDelete;
  });

  TRACE("New surface {}", surface->id);
}

void
wl_region_destroy(wl_client *, wl_resource *wl_region) {
  wl_resource_destroy(wl_region);
}

// Regions only matter for input and opaque hints, neither of which
// this server uses; they are accepted and dropped.
void
wl_region_add(wl_client *, wl_resource *, int32_t, int32_t, int32_t, int32_t) {}

void
wl_region_subtract(wl_client *, wl_resource *, int32_t, int32_t, int32_t, int32_t) {}

const struct wl_region_interface wl_region_impl = {
  .destroy  = wl_region_destroy,
  .add      = wl_region_add,
  .subtract = wl_region_subtract,
};

void
wl_compositor_create_region(wl_client *client, wl_resource *wl_compositor, uint32_t id) {
  make_resource<region_t>(
    client, wl_region_interface, wl_region_impl, wl_resource_get_version(wl_compositor), id);
}
