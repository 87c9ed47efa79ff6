#include "basalt/shell/events.hpp"

#include <array>

namespace basalt {

  namespace {
    // Same order as the alternatives of shell_event_t.
    constexpr std::array<const char *, 16> EVENT_NAMES = {
      "window_created",     "window_move",       "window_resize",       "window_got_resized",
      "window_maximize",    "window_unmaximize", "window_fullscreen",   "window_unfullscreen",
      "window_minimize",    "popup_created",     "popup_grab",          "show_window_menu",
      "surface_commit",     "layer_created",     "layer_ack_configure", "surface_abandoned",
    };

    static_assert(EVENT_NAMES.size() == std::variant_size_v<shell_event_t>,
                  "every shell event needs a name");
  }

  const char *
  event_name(const shell_event_t &event) {
    return EVENT_NAMES[event.index()];
  }

}
