#pragma once

#include "basalt/core/point.hpp"
#include "basalt/core/surface_id.hpp"
#include "basalt/shell/layer.hpp"
#include "basalt/shell/positioner.hpp"
#include "basalt/shell/protocol.hpp"
#include "basalt/shell/surface_data.hpp"
#include "basalt/shell/window.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace basalt {
  // Notifications delivered to the policy layer. All of them are
  // queued while the shell mutates its state and flushed once the
  // mutation is complete, so a listener may call back into the shell.

  struct window_created_t {
    std::shared_ptr<window_t> window;
  };

  struct window_move_t {
    std::shared_ptr<window_t> window;
    grab_start_data_t         start_data;
    seat_id_t                 seat;
    uint32_t                  serial;
  };

  struct window_resize_t {
    std::shared_ptr<window_t> window;
    grab_start_data_t         start_data;
    seat_id_t                 seat;
    resize_edge_t             edges;
    uint32_t                  serial;
  };

  /// A left/top resize or a queued move changed where the window
  /// belongs. An empty axis is unchanged.
  struct window_got_resized_t {
    std::shared_ptr<window_t> window;
    std::optional<int32_t>    new_x;
    std::optional<int32_t>    new_y;
  };

  struct window_maximize_t {
    std::shared_ptr<window_t> window;
  };

  struct window_unmaximize_t {
    std::shared_ptr<window_t> window;
  };

  struct window_fullscreen_t {
    std::shared_ptr<window_t>  window;
    std::optional<output_id_t> output;
  };

  struct window_unfullscreen_t {
    std::shared_ptr<window_t> window;
  };

  struct window_minimize_t {
    std::shared_ptr<window_t> window;
  };

  struct popup_created_t {
    surface_id_t       surface;
    surface_id_t       parent;
    positioner_state_t positioner;
  };

  struct popup_grab_t {
    surface_id_t      surface;
    grab_start_data_t start_data;
    seat_id_t         seat;
    uint32_t          serial;
  };

  struct show_window_menu_t {
    std::shared_ptr<window_t> window;
    seat_id_t                 seat;
    uint32_t                  serial;
    ipoint_t                  location;
  };

  struct surface_commit_t {
    surface_id_t surface;
  };

  struct layer_created_t {
    std::shared_ptr<layer_entry_t> layer_surface;
    std::optional<output_id_t>     output;
    layer_t                        layer;
    std::string                    namespace_;
  };

  struct layer_ack_configure_t {
    surface_id_t      surface;
    layer_configure_t configure;
  };

  /// The initial configure could not be delivered; the shell no
  /// longer tracks a role for `surface`.
  struct surface_abandoned_t {
    surface_id_t surface;
    std::string  reason;
  };

  using shell_event_t = std::variant<window_created_t,
                                     window_move_t,
                                     window_resize_t,
                                     window_got_resized_t,
                                     window_maximize_t,
                                     window_unmaximize_t,
                                     window_fullscreen_t,
                                     window_unfullscreen_t,
                                     window_minimize_t,
                                     popup_created_t,
                                     popup_grab_t,
                                     show_window_menu_t,
                                     surface_commit_t,
                                     layer_created_t,
                                     layer_ack_configure_t,
                                     surface_abandoned_t>;

  /// Short, stable name of the event's alternative, for logging.
  const char *
  event_name(const shell_event_t &);
}
