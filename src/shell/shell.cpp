#include "basalt/shell/shell.hpp"

#include "../log.hpp"

#include <stdexcept>

namespace basalt {

  shell_t::dispatch_guard_t::dispatch_guard_t(shell_t &shell)
    : shell_(shell) {
    if (shell_.dispatching_)
      throw std::logic_error("shell_t: re-entrant dispatch");
    shell_.dispatching_ = true;
  }

  shell_t::dispatch_guard_t::~dispatch_guard_t() {
    shell_.dispatching_ = false;
  }

  shell_t::shell_t(protocol_t &protocol, shell_options_t options)
    : protocol_(protocol)
    , options_(options) {}

  void
  shell_t::queue(shell_event_t event) {
    queue_.push_back(std::move(event));
  }

  void
  shell_t::flush() {
    // A listener calling back into the shell ends up here again; its
    // events are appended to the queue and delivered by the outer
    // loop, after the ones already queued.
    if (flushing_)
      return;

    struct reset_t {
      bool &flag;
      ~reset_t() {
        flag = false;
      }
    } reset{ flushing_ };
    flushing_ = true;

    while (!queue_.empty()) {
      auto event = std::move(queue_.front());
      queue_.pop_front();
      events.on_event.emit(event);
    }
  }

  bool
  shell_t::has_role(surface_id_t surface) const {
    return pending_.contains(surface) || windows_.contains(surface) ||
           popups_.contains(surface) || layers_.contains(surface);
  }

  bool
  shell_t::is_abandoned(surface_id_t surface) const {
    auto *data = data_.find(surface);
    return data && data->abandoned;
  }

  void
  shell_t::abandon(surface_id_t surface, const std::string &reason) {
    ERROR("Initial configure of {} failed, dropping its role: {}", surface, reason);

    pending_.remove(surface);
    popups_.remove(surface);
    layers_.remove(surface);
    windows_.remove(surface);

    data_.ensure(surface).abandoned = true;
    queue(surface_abandoned_t{ .surface = surface, .reason = reason });
  }

  bool
  shell_t::send_initial_toplevel_configure(surface_id_t surface) {
    auto pending = pending_.find_mut(surface);
    if (!pending || pending->initial_configure_sent)
      return true;

    // Mark first, so no later commit can send a second one.
    pending->initial_configure_sent = true;
    try {
      auto serial = protocol_.send_toplevel_configure(surface, toplevel_state_t{});
      TRACE("Initial configure {} sent to toplevel {}", serial, surface);
    } catch (const configure_error_t &e) {
      abandon(surface, e.what());
      return false;
    }
    return true;
  }

  bool
  shell_t::send_initial_popup_configure(surface_id_t surface) {
    auto popup = popups_.find_mut(surface);
    if (!popup || popup->initial_configure_sent)
      return true;

    popup->initial_configure_sent = true;
    try {
      auto serial = protocol_.send_popup_configure(surface, popup->geometry);
      TRACE("Initial configure {} sent to popup {}", serial, surface);
    } catch (const configure_error_t &e) {
      abandon(surface, e.what());
      return false;
    }
    return true;
  }

  bool
  shell_t::send_initial_layer_configure(surface_id_t surface) {
    auto layer = layers_.find_mut(surface);
    if (!layer || layer->initial_configure_sent)
      return true;

    layer->initial_configure_sent = true;
    try {
      auto serial = protocol_.send_layer_configure(surface, layer->pending_size);
      layer->outstanding.push({ .serial = serial, .size = layer->pending_size });
      TRACE("Initial configure {} sent to layer surface {}", serial, surface);
    } catch (const configure_error_t &e) {
      abandon(surface, e.what());
      return false;
    }
    return true;
  }

  void
  shell_t::update_mapped(surface_id_t surface) {
    auto window = windows_.find_mut(surface);
    if (!window)
      return;

    if (auto geometry = protocol_.window_geometry(surface))
      window->geometry = *geometry;

    auto update = data_.with_mut(
      surface, [&](surface_data_t &data) { return data.on_commit(window->size()); });

    if (update && update->changed()) {
      queue(window_got_resized_t{ .window = window, .new_x = update->x, .new_y = update->y });
    }
  }

  void
  shell_t::commit(surface_id_t surface) {
    dispatch([&] {
      protocol_.import_buffer(surface);

      // Once abandoned, the surface is a plain wl_surface for us.
      if (is_abandoned(surface)) {
        queue(surface_commit_t{ surface });
        return;
      }

      if (!protocol_.is_sync_subsurface(surface)) {
        for (auto id : protocol_.surface_tree(surface))
          data_.ensure(id);
      }

      bool configured = true;
      if (pending_.contains(surface)) {
        configured = send_initial_toplevel_configure(surface);
        if (configured) {
          if (auto window = pending_.try_promote(surface, protocol_)) {
            INFO("Mapped toplevel {} ({}x{})", surface, window->size().x, window->size().y);
            windows_.insert(window);
            queue(window_created_t{ window });
          }
        }
      } else if (windows_.contains(surface)) {
        update_mapped(surface);
      }

      if (configured)
        configured = send_initial_popup_configure(surface);

      if (configured)
        send_initial_layer_configure(surface);

      queue(surface_commit_t{ surface });
    });
  }

  void
  shell_t::surface_destroyed(surface_id_t surface) {
    dispatch([&] {
      pending_.remove(surface);
      popups_.remove(surface);
      data_.erase(surface);
      TRACE("Surface {} destroyed", surface);
    });
  }

  void
  shell_t::refresh() {
    dispatch([&] {
      auto windows = windows_.refresh(protocol_);
      auto layers  = layers_.refresh(protocol_);
      auto pending = pending_.refresh(protocol_);
      auto popups  = popups_.refresh(protocol_);
      data_.retain([&](surface_id_t id, const surface_data_t &) { return protocol_.alive(id); });

      if (windows + layers + pending + popups > 0)
        TRACE("Refresh dropped {} windows, {} layers, {} pending toplevels and {} popups",
              windows,
              layers,
              pending,
              popups);
    });
  }

}
