#include "basalt/wayland/server.hpp"
#include "basalt/wayland/layer_shell.hpp"
#include "basalt/wayland/wl_compositor.hpp"
#include "basalt/wayland/wl_subcompositor.hpp"
#include "basalt/wayland/xdg_shell.hpp"

#include "../log.hpp"

#include <csignal>
#include <ctime>
#include <format>
#include <stdexcept>
#include <utility>
#include <wayland-server-core.h>
#include <wayland-server-protocol.h>

namespace basalt::wayland {

  namespace {
    uint32_t
    now_msec() {
      timespec now;
      clock_gettime(CLOCK_MONOTONIC, &now);
      return static_cast<uint32_t>(now.tv_sec * 1000 + now.tv_nsec / 1000000);
    }

    void
    collect_tree(const surface_t &surface, std::vector<surface_id_t> &out) {
      out.push_back(surface.id);
      for (const auto &child : surface.children) {
        if (auto child_surface = child->surface.lock(); child_surface)
          collect_tree(*child_surface, out);
      }
    }

    /// Read the size of a freshly committed buffer, release it and
    /// complete the pending frame callbacks. Nothing is drawn.
    void
    import_one(surface_t &surface) {
      if (auto buffer = std::exchange(surface.buffer, nullptr); buffer) {
        if (buffer->buffer == nullptr) {
          TRACE("Buffer of {} was destroyed before it was imported", surface.id);
        } else {
          if (auto *shm = wl_shm_buffer_get(buffer->buffer); shm) {
            ipoint_t size{ wl_shm_buffer_get_width(shm), wl_shm_buffer_get_height(shm) };
            surface.size = size / surface.scale;
          } else {
            WARN("{} committed a buffer that is not wl_shm, ignoring it", surface.id);
          }
          wl_buffer_send_release(buffer->buffer);
        }
      }

      auto callbacks = std::exchange(surface.frame_callbacks, {});
      auto time      = now_msec();
      for (auto *callback : callbacks) {
        wl_callback_send_done(callback, time);
        wl_resource_destroy(callback);
      }
    }
  }

  server_t::server_t(const config_t &config)
    : display_(wl_display_create())
    , loop_(nullptr)
    , shell_(*this, shell_options_t{ .strict_layer_acks = config.shell.strict_layer_acks }) {
    if (!display_)
      throw std::runtime_error("Failed to create the wayland display");
    loop_ = wl_display_get_event_loop(display_);

    auto fail = [this](const std::string &what) {
      wl_display_destroy(display_);
      display_ = nullptr;
      throw std::runtime_error(what);
    };

    if (config.socket) {
      if (wl_display_add_socket(display_, config.socket->c_str()) != 0)
        fail(std::format("Failed to open the wayland socket {}", *config.socket));
      socket_ = *config.socket;
    } else {
      const char *socket = wl_display_add_socket_auto(display_);
      if (!socket)
        fail("Failed to find a free wayland socket");
      socket_ = socket;
    }

    if (wl_display_init_shm(display_) != 0)
      fail("Failed to initialize wl_shm");

    compositor_    = std::make_unique<wl_compositor_t>(*this);
    subcompositor_ = std::make_unique<wl_subcompositor_t>(*this);
    xdg_wm_base_ =
      std::make_unique<xdg_wm_base_t>(*this, static_cast<uint32_t>(config.shell.xdg_wm_base_version));
    layer_shell_ =
      std::make_unique<layer_shell_t>(*this, static_cast<uint32_t>(config.shell.layer_shell_version));

    auto on_signal = +[](int signal, void *data) {
      INFO("Received signal {}, shutting down", signal);
      static_cast<server_t *>(data)->terminate();
      return 0;
    };
    sigint_  = wl_event_loop_add_signal(loop_, SIGINT, on_signal, this);
    sigterm_ = wl_event_loop_add_signal(loop_, SIGTERM, on_signal, this);
  }

  server_t::~server_t() {
    if (!display_)
      return;

    if (sigint_)
      wl_event_source_remove(sigint_);
    if (sigterm_)
      wl_event_source_remove(sigterm_);

    // Clients go first, their resources call back into the shell.
    wl_display_destroy_clients(display_);

    layer_shell_.reset();
    xdg_wm_base_.reset();
    subcompositor_.reset();
    compositor_.reset();

    wl_display_destroy(display_);
  }

  uint32_t
  server_t::next_serial() {
    return wl_display_next_serial(display_);
  }

  resource_ptr_t<surface_t>
  server_t::lookup(surface_id_t id) const {
    auto *ref = surfaces_.find(id);
    return ref ? ref->lock() : nullptr;
  }

  surface_id_t
  server_t::register_surface(const resource_ptr_t<surface_t> &surface) {
    return surfaces_.insert(surface_ref_t(surface));
  }

  void
  server_t::unregister_surface(surface_t &surface) {
    auto id = std::exchange(surface.id, surface_id_t{});
    if (!surfaces_.contains(id))
      return;

    shell_.surface_destroyed(id);
    surfaces_.erase(id);
  }

  void
  server_t::retire_role(surface_t &surface) {
    auto *ref = surfaces_.find(surface.id);
    if (!ref)
      return;

    auto keep = *ref;
    auto old  = surface.id;

    shell_.surface_destroyed(old);
    surfaces_.erase(old);

    surface.id          = surfaces_.insert(std::move(keep));
    surface.role_object = nullptr;
    TRACE("Role object of {} destroyed, surface continues as {}", old, surface.id);
  }

  void
  server_t::run() {
    INFO("Running on WAYLAND_DISPLAY={}", socket_);

    running_ = true;
    while (running_) {
      wl_display_flush_clients(display_);
      if (wl_event_loop_dispatch(loop_, -1) < 0) {
        ERROR("Event loop dispatch failed, stopping");
        break;
      }

      shell_.refresh();
    }
  }

  void
  server_t::terminate() {
    running_ = false;
  }

  bool
  server_t::alive(surface_id_t id) const {
    return lookup(id) != nullptr;
  }

  bool
  server_t::has_buffer(surface_id_t id) const {
    auto surface = lookup(id);
    return surface && surface->size.has_value();
  }

  bool
  server_t::is_sync_subsurface(surface_id_t id) const {
    auto surface = lookup(id);
    return surface && surface->synchronized();
  }

  std::vector<surface_id_t>
  server_t::surface_tree(surface_id_t id) const {
    std::vector<surface_id_t> tree;
    if (auto surface = lookup(id); surface)
      collect_tree(*surface, tree);
    return tree;
  }

  std::optional<region_t>
  server_t::window_geometry(surface_id_t id) const {
    auto surface = lookup(id);
    if (!surface)
      return std::nullopt;

    if (surface->window_geometry && !surface->window_geometry->empty())
      return surface->window_geometry;

    // Without an explicit geometry the whole buffer is the window.
    if (surface->size)
      return region_t({ 0, 0 }, *surface->size);

    return std::nullopt;
  }

  std::optional<grab_start_data_t>
  server_t::grab_start_data(seat_id_t seat, uint32_t serial, surface_id_t surface) const {
    if (!grab_lookup)
      return std::nullopt;
    return grab_lookup(seat, serial, surface);
  }

  void
  server_t::import_buffer(surface_id_t id) {
    auto root = lookup(id);
    if (!root)
      return;

    // Synchronized children had their cached state applied by this
    // commit; their buffers are imported along with the root's.
    std::vector<surface_id_t> tree;
    collect_tree(*root, tree);
    for (auto member : tree) {
      if (auto surface = lookup(member); surface)
        import_one(*surface);
    }
  }

  uint32_t
  server_t::send_toplevel_configure(surface_id_t id, const toplevel_state_t &state) {
    auto surface = lookup(id);
    if (!surface || surface->role != surface_role_t::eXdgToplevel || !surface->role_object ||
        !surface->xdg_surface)
      throw configure_error_t(id, "the xdg_toplevel is gone");

    wl_array states;
    wl_array_init(&states);
    auto push = [&](xdg_toplevel_state value) {
      auto *slot = static_cast<uint32_t *>(wl_array_add(&states, sizeof(uint32_t)));
      if (slot)
        *slot = value;
    };
    if (state.maximized)
      push(XDG_TOPLEVEL_STATE_MAXIMIZED);
    if (state.fullscreen)
      push(XDG_TOPLEVEL_STATE_FULLSCREEN);
    if (state.resizing)
      push(XDG_TOPLEVEL_STATE_RESIZING);
    if (state.activated)
      push(XDG_TOPLEVEL_STATE_ACTIVATED);

    auto size = state.size.value_or(ipoint_t{ 0, 0 });
    xdg_toplevel_send_configure(surface->role_object, size.x, size.y, &states);
    wl_array_release(&states);

    auto serial = next_serial();
    xdg_surface_send_configure(surface->xdg_surface, serial);
    from_wl_resource<xdg_surface_t>(surface->xdg_surface)->pending_serials.push(serial);
    return serial;
  }

  uint32_t
  server_t::send_popup_configure(surface_id_t id, const region_t &geometry) {
    auto surface = lookup(id);
    if (!surface || surface->role != surface_role_t::eXdgPopup || !surface->role_object ||
        !surface->xdg_surface)
      throw configure_error_t(id, "the xdg_popup is gone");

    xdg_popup_send_configure(surface->role_object, geometry.x, geometry.y, geometry.w, geometry.h);

    auto serial = next_serial();
    xdg_surface_send_configure(surface->xdg_surface, serial);
    from_wl_resource<xdg_surface_t>(surface->xdg_surface)->pending_serials.push(serial);
    return serial;
  }

  uint32_t
  server_t::send_layer_configure(surface_id_t id, const ipoint_t &size) {
    auto surface = lookup(id);
    if (!surface || surface->role != surface_role_t::eLayerSurface || !surface->role_object)
      throw configure_error_t(id, "the zwlr_layer_surface_v1 is gone");

    auto serial = next_serial();
    zwlr_layer_surface_v1_send_configure(surface->role_object,
                                         serial,
                                         static_cast<uint32_t>(size.x),
                                         static_cast<uint32_t>(size.y));
    return serial;
  }

}
