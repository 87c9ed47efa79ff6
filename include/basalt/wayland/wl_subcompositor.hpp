#pragma once

#include <cstdint>
#include <wayland-server-core.h>

extern const struct wl_subcompositor_interface wl_subcompositor_impl;
extern const struct wl_subsurface_interface    wl_subsurface_impl;

namespace basalt::wayland {
  class server_t;

  class wl_subcompositor_t {
    public:
    server_t  &server;
    wl_global *global;

    static constexpr uint32_t VERSION = 1;

    explicit wl_subcompositor_t(server_t &server);
    ~wl_subcompositor_t();

    private:
    static void
    bind(wl_client *, void *, uint32_t version, uint32_t id);
  };
}
