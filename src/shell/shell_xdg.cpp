#include "basalt/shell/shell.hpp"

#include "../log.hpp"

namespace basalt {

  std::shared_ptr<window_t>
  shell_t::window_for_request(surface_id_t surface, const char *request) {
    auto window = windows_.find_mut(surface);
    if (!window)
      TRACE("Ignoring {} for {}, not a mapped window", request, surface);
    return window;
  }

  void
  shell_t::new_toplevel(surface_id_t surface) {
    dispatch([&] {
      if (has_role(surface) || is_abandoned(surface)) {
        WARN("{} already has a shell role, ignoring new toplevel", surface);
        return;
      }

      pending_.insert(surface);
      data_.ensure(surface);
      TRACE("New toplevel {}", surface);
    });
  }

  void
  shell_t::new_popup(surface_id_t surface, surface_id_t parent, const positioner_state_t &positioner) {
    dispatch([&] {
      if (has_role(surface) || is_abandoned(surface)) {
        WARN("{} already has a shell role, ignoring new popup", surface);
        return;
      }

      popups_.track(surface, parent, positioner);
      data_.ensure(surface);
      TRACE("New popup {} on {}", surface, parent);
      queue(popup_created_t{ .surface = surface, .parent = parent, .positioner = positioner });
    });
  }

  void
  shell_t::ack_configure(surface_id_t surface, uint32_t serial) {
    dispatch([&] {
      auto found = data_.with_mut(surface, [&](surface_data_t &data) {
        auto *waiting = std::get_if<waiting_for_final_ack_t>(&data.resize_state);
        if (!waiting || !serial_not_older(serial, waiting->serial))
          return;

        TRACE("{} acked the final resize configure ({})", surface, serial);
        data.resize_state = waiting_for_commit_t{ waiting->data };
      });

      if (!found)
        TRACE("Ignoring ack_configure({}) for unknown {}", serial, surface);
    });
  }

  void
  shell_t::move_request(surface_id_t surface, seat_id_t seat, uint32_t serial) {
    dispatch([&] {
      auto window = window_for_request(surface, "move");
      if (!window)
        return;

      auto start_data = protocol_.grab_start_data(seat, serial, surface);
      if (!start_data) {
        TRACE("Ignoring move of {}, serial {} does not start a grab", surface, serial);
        return;
      }

      queue(window_move_t{
        .window = window, .start_data = *start_data, .seat = seat, .serial = serial });
    });
  }

  void
  shell_t::resize_request(surface_id_t  surface,
                          seat_id_t     seat,
                          uint32_t      serial,
                          resize_edge_t edges) {
    dispatch([&] {
      auto window = window_for_request(surface, "resize");
      if (!window)
        return;

      auto start_data = protocol_.grab_start_data(seat, serial, surface);
      if (!start_data) {
        TRACE("Ignoring resize of {}, serial {} does not start a grab", surface, serial);
        return;
      }

      resize_data_t resize{ .edges                   = edges,
                            .initial_window_location = window->location,
                            .initial_window_size     = window->size() };
      data_.with_mut(surface,
                     [&](surface_data_t &data) { data.resize_state = resizing_t{ resize }; });

      TRACE("Resizing {} from the {} edge", surface, to_string(edges));
      queue(window_resize_t{ .window     = window,
                             .start_data = *start_data,
                             .seat       = seat,
                             .edges      = edges,
                             .serial     = serial });
    });
  }

  void
  shell_t::maximize_request(surface_id_t surface) {
    dispatch([&] {
      if (auto window = window_for_request(surface, "maximize"))
        queue(window_maximize_t{ window });
    });
  }

  void
  shell_t::unmaximize_request(surface_id_t surface) {
    dispatch([&] {
      if (auto window = window_for_request(surface, "unmaximize"))
        queue(window_unmaximize_t{ window });
    });
  }

  void
  shell_t::fullscreen_request(surface_id_t surface, std::optional<output_id_t> output) {
    dispatch([&] {
      if (auto window = window_for_request(surface, "fullscreen"))
        queue(window_fullscreen_t{ .window = window, .output = output });
    });
  }

  void
  shell_t::unfullscreen_request(surface_id_t surface) {
    dispatch([&] {
      if (auto window = window_for_request(surface, "unfullscreen"))
        queue(window_unfullscreen_t{ window });
    });
  }

  void
  shell_t::minimize_request(surface_id_t surface) {
    dispatch([&] {
      if (auto window = window_for_request(surface, "minimize"))
        queue(window_minimize_t{ window });
    });
  }

  void
  shell_t::show_window_menu_request(surface_id_t    surface,
                                    seat_id_t       seat,
                                    uint32_t        serial,
                                    const ipoint_t &location) {
    dispatch([&] {
      if (auto window = window_for_request(surface, "show_window_menu"))
        queue(show_window_menu_t{
          .window = window, .seat = seat, .serial = serial, .location = location });
    });
  }

  void
  shell_t::popup_grab_request(surface_id_t surface, seat_id_t seat, uint32_t serial) {
    dispatch([&] {
      auto popup = popups_.find(surface);
      if (!popup) {
        TRACE("Ignoring grab for {}, not a popup", surface);
        return;
      }

      // The click that opened the popup landed on its parent.
      auto start_data = protocol_.grab_start_data(seat, serial, popup->parent);
      if (!start_data) {
        TRACE("Ignoring grab for popup {}, serial {} does not start a grab", surface, serial);
        return;
      }

      queue(popup_grab_t{
        .surface = surface, .start_data = *start_data, .seat = seat, .serial = serial });
    });
  }

  void
  shell_t::reposition_popup(surface_id_t surface, const positioner_state_t &positioner) {
    dispatch([&] {
      if (!popups_.reposition(surface, positioner)) {
        TRACE("Ignoring reposition of {}, not a popup", surface);
        return;
      }

      auto popup = popups_.find(surface);
      if (!popup->initial_configure_sent)
        return;

      try {
        protocol_.send_popup_configure(surface, popup->geometry);
      } catch (const configure_error_t &e) {
        ERROR("Failed to reposition popup {}: {}", surface, e.what());
      }
    });
  }

  std::optional<uint32_t>
  shell_t::configure_toplevel(surface_id_t surface, const toplevel_state_t &state) {
    return dispatch([&]() -> std::optional<uint32_t> {
      if (!windows_.contains(surface)) {
        auto pending = pending_.find(surface);
        if (!pending || !pending->initial_configure_sent) {
          TRACE("Refusing to configure {}, role not negotiated", surface);
          return std::nullopt;
        }
      }

      try {
        return protocol_.send_toplevel_configure(surface, state);
      } catch (const configure_error_t &e) {
        ERROR("Failed to configure toplevel {}: {}", surface, e.what());
        return std::nullopt;
      }
    });
  }

  std::optional<uint32_t>
  shell_t::end_resize(surface_id_t surface, const toplevel_state_t &state) {
    return dispatch([&]() -> std::optional<uint32_t> {
      if (!windows_.contains(surface)) {
        TRACE("Refusing to end resize of {}, not a mapped window", surface);
        return std::nullopt;
      }

      auto *data = data_.find(surface);
      if (!data || !std::holds_alternative<resizing_t>(data->resize_state)) {
        TRACE("Refusing to end resize of {}, not resizing", surface);
        return std::nullopt;
      }

      auto final_state     = state;
      final_state.resizing = false;

      uint32_t serial;
      try {
        serial = protocol_.send_toplevel_configure(surface, final_state);
      } catch (const configure_error_t &e) {
        ERROR("Failed to send the final resize configure to {}: {}", surface, e.what());
        return std::nullopt;
      }

      data_.with_mut(surface, [&](surface_data_t &data) {
        auto resize       = std::get<resizing_t>(data.resize_state).data;
        data.resize_state = waiting_for_final_ack_t{ .data = resize, .serial = serial };
      });
      return serial;
    });
  }

  bool
  shell_t::move_after_resize(surface_id_t surface, const ipoint_t &target) {
    return dispatch([&] {
      if (!windows_.contains(surface)) {
        TRACE("Refusing move-after-resize of {}, not a mapped window", surface);
        return false;
      }

      return data_.with_mut(surface, [&](surface_data_t &data) {
        data.move_after_resize_state = move_waiting_for_commit_t{ target };
      });
    });
  }

  std::optional<uint32_t>
  shell_t::configure_popup(surface_id_t surface) {
    return dispatch([&]() -> std::optional<uint32_t> {
      auto popup = popups_.find(surface);
      if (!popup || !popup->initial_configure_sent) {
        TRACE("Refusing to configure {}, role not negotiated", surface);
        return std::nullopt;
      }

      try {
        return protocol_.send_popup_configure(surface, popup->geometry);
      } catch (const configure_error_t &e) {
        ERROR("Failed to configure popup {}: {}", surface, e.what());
        return std::nullopt;
      }
    });
  }

}
