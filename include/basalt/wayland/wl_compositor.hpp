#pragma once

#include <cstdint>
#include <wayland-server-core.h>

extern const struct wl_compositor_interface wl_compositor_impl;
extern const struct wl_region_interface     wl_region_impl;

namespace basalt::wayland {
  class server_t;

  class wl_compositor_t {
    public:
    server_t  &server;
    wl_global *global;

    static constexpr uint32_t VERSION = 6;

    explicit wl_compositor_t(server_t &server);
    ~wl_compositor_t();

    private:
    static void
    bind(wl_client *, void *, uint32_t, uint32_t);
  };
}
