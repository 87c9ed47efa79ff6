#pragma once

#include "basalt/core/point.hpp"

#include <cstdint>
#include <optional>
#include <variant>

namespace basalt {

  /// Resize edges, numerically identical to `xdg_toplevel.resize_edge`.
  enum class resize_edge_t : uint32_t {
    eNone        = 0,
    eTop         = 1,
    eBottom      = 2,
    eLeft        = 4,
    eTopLeft     = 5,
    eBottomLeft  = 6,
    eRight       = 8,
    eTopRight    = 9,
    eBottomRight = 10,
  };

  /// Accepts the four single edges and the four corners; everything
  /// else (including `eNone`) yields an empty optional.
  std::optional<resize_edge_t>
  resize_edge_from_wire(uint32_t value);

  /// True when `edges` shares at least one edge with `mask`.
  inline bool
  intersects(resize_edge_t edges, resize_edge_t mask) {
    return (static_cast<uint32_t>(edges) & static_cast<uint32_t>(mask)) != 0;
  }

  const char *
  to_string(resize_edge_t edges);

  struct resize_data_t {
    resize_edge_t edges;
    ipoint_t      initial_window_location;
    ipoint_t      initial_window_size;
  };

  // Resize state machine:
  //   not_resizing -> resizing -> waiting_for_final_ack -> waiting_for_commit -> not_resizing
  struct not_resizing_t {};
  struct resizing_t {
    resize_data_t data;
  };
  struct waiting_for_final_ack_t {
    resize_data_t data;
    uint32_t      serial;
  };
  struct waiting_for_commit_t {
    resize_data_t data;
  };

  using resize_state_t =
    std::variant<not_resizing_t, resizing_t, waiting_for_final_ack_t, waiting_for_commit_t>;

  /// The resize data carried by every state but `not_resizing_t`.
  std::optional<resize_data_t>
  active_resize(const resize_state_t &);

  // Move-after-resize: the compositor may queue a target location that
  // is applied atomically with the commit finishing a resize.
  struct move_idle_t {};
  struct move_waiting_for_commit_t {
    ipoint_t target_window_location;
  };
  struct move_current_t {
    ipoint_t target_window_location;
  };

  using move_after_resize_state_t =
    std::variant<move_idle_t, move_waiting_for_commit_t, move_current_t>;

  /// Location changes produced by one commit; an empty axis is
  /// unchanged.
  struct location_update_t {
    std::optional<int32_t> x, y;

    bool
    changed() const {
      return x.has_value() || y.has_value();
    }
  };

  /// Auxiliary per-surface state, lives in the shell's slot table.
  struct surface_data_t {
    resize_state_t            resize_state{ not_resizing_t{} };
    move_after_resize_state_t move_after_resize_state{ move_idle_t{} };

    /// Set once the initial configure handshake failed; the shell
    /// stops tracking roles for this surface.
    bool abandoned{ false };

    /**
     * @brief Reconcile location drift for a commit of a mapped window.
     *
     * Left/top resizes keep the opposite edge fixed by moving the
     * window; a queued move-after-resize target is applied on top of
     * that. `waiting_for_commit_t` collapses to `not_resizing_t` and a
     * queued move becomes `move_current_t`.
     *
     * @param current_size Window size after this commit.
     */
    location_update_t
    on_commit(const ipoint_t &current_size);

    bool
    resizing() const {
      return !std::holds_alternative<not_resizing_t>(resize_state);
    }
  };

  /// Serial comparison with wrap-around; true when `a` was issued at
  /// or after `b`.
  inline bool
  serial_not_older(uint32_t a, uint32_t b) {
    return static_cast<int32_t>(a - b) >= 0;
  }
}
