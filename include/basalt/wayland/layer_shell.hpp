#pragma once

#include "basalt/core/point.hpp"
#include "basalt/core/signal.hpp"
#include "basalt/shell/layer.hpp"
#include "basalt/wayland/resource.hpp"
#include "basalt/wayland/surface.hpp"

#include "wl/wlr-layer-shell-unstable-v1-protocol.h"

#include <cstdint>
#include <memory>
#include <wayland-server-core.h>

extern const struct zwlr_layer_shell_v1_interface   zwlr_layer_shell_v1_impl;
extern const struct zwlr_layer_surface_v1_interface zwlr_layer_surface_v1_impl;

namespace basalt::wayland {
  class server_t;

  class layer_shell_t {
    public:
    server_t  &server;
    wl_global *global;

    static constexpr uint32_t MAX_VERSION = 4;

    layer_shell_t(server_t &server, uint32_t version);
    ~layer_shell_t();

    private:
    static void
    bind(wl_client *, void *, uint32_t, uint32_t);
  };

  struct layer_surface_t {
    server_t                            &server;
    std::weak_ptr<resource_t<surface_t>> surface;

    // Double-buffered; `current` is handed to the shell on commit.
    layer_state_t pending, current;

    signal_token_t on_commit{ -1 };

    layer_surface_t(server_t &server, resource_ptr_t<surface_t> surface, layer_t layer);
    ~layer_surface_t();
  };
}
