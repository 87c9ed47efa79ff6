#include "basalt/shell/surface_data.hpp"

namespace basalt {

  std::optional<resize_edge_t>
  resize_edge_from_wire(uint32_t value) {
    switch (static_cast<resize_edge_t>(value)) {
      case resize_edge_t::eTop:
      case resize_edge_t::eBottom:
      case resize_edge_t::eLeft:
      case resize_edge_t::eRight:
      case resize_edge_t::eTopLeft:
      case resize_edge_t::eTopRight:
      case resize_edge_t::eBottomLeft:
      case resize_edge_t::eBottomRight:
        return static_cast<resize_edge_t>(value);
      default:
        return std::nullopt;
    }
  }

  const char *
  to_string(resize_edge_t edges) {
    switch (edges) {
      case resize_edge_t::eNone:
        return "none";
      case resize_edge_t::eTop:
        return "top";
      case resize_edge_t::eBottom:
        return "bottom";
      case resize_edge_t::eLeft:
        return "left";
      case resize_edge_t::eRight:
        return "right";
      case resize_edge_t::eTopLeft:
        return "top-left";
      case resize_edge_t::eTopRight:
        return "top-right";
      case resize_edge_t::eBottomLeft:
        return "bottom-left";
      case resize_edge_t::eBottomRight:
        return "bottom-right";
    }
    return "invalid";
  }

  std::optional<resize_data_t>
  active_resize(const resize_state_t &state) {
    if (auto *s = std::get_if<resizing_t>(&state))
      return s->data;
    if (auto *s = std::get_if<waiting_for_final_ack_t>(&state))
      return s->data;
    if (auto *s = std::get_if<waiting_for_commit_t>(&state))
      return s->data;
    return std::nullopt;
  }

  location_update_t
  surface_data_t::on_commit(const ipoint_t &current_size) {
    location_update_t update;

    // If the window is being resized by top or left, its location must
    // be adjusted so that the opposite edge stays where it was.
    if (auto data = active_resize(resize_state)) {
      if (intersects(data->edges, resize_edge_t::eLeft)) {
        update.x =
          data->initial_window_location.x + (data->initial_window_size.x - current_size.x);
      }
      if (intersects(data->edges, resize_edge_t::eTop)) {
        update.y =
          data->initial_window_location.y + (data->initial_window_size.y - current_size.y);
      }
    }

    // The commit we were waiting for finishes the resize.
    if (std::holds_alternative<waiting_for_commit_t>(resize_state))
      resize_state = not_resizing_t{};

    if (auto *queued = std::get_if<move_waiting_for_commit_t>(&move_after_resize_state)) {
      auto target             = queued->target_window_location;
      update.x                = target.x;
      update.y                = target.y;
      move_after_resize_state = move_current_t{ target };
    }

    return update;
  }

}
