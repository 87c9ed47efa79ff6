#pragma once

#include "basalt/core/point.hpp"
#include "basalt/core/signal.hpp"
#include "basalt/core/slot_table.hpp"
#include "basalt/core/surface_id.hpp"
#include "basalt/shell/events.hpp"
#include "basalt/shell/layer.hpp"
#include "basalt/shell/pending_list.hpp"
#include "basalt/shell/popup_tracker.hpp"
#include "basalt/shell/positioner.hpp"
#include "basalt/shell/protocol.hpp"
#include "basalt/shell/surface_data.hpp"
#include "basalt/shell/surface_list.hpp"
#include "basalt/shell/window.hpp"

#include <deque>
#include <optional>
#include <string>
#include <type_traits>

namespace basalt {
  using window_list_t = surface_list_t<window_t>;
  using layer_list_t  = surface_list_t<layer_entry_t>;

  struct shell_options_t {
    /// Only forward layer acks whose serial matches a configure that
    /// was actually sent to that layer surface.
    bool strict_layer_acks{ true };
  };

  /**
   * @brief Owner of every shell role the compositor knows about.
   *
   * The protocol layer feeds requests and commits in, the policy layer
   * listens on `events.on_event` and answers with the command methods
   * (`configure_toplevel`, `end_resize`, ...). Every entry point runs
   * under a single dispatch guard; events raised while it is held are
   * queued and delivered in order once the entry point is done, which
   * lets a listener call straight back into the shell.
   */
  class shell_t {
    protocol_t                  &protocol_;
    shell_options_t              options_;
    pending_list_t               pending_;
    window_list_t                windows_;
    layer_list_t                 layers_;
    popup_tracker_t              popups_;
    slot_table_t<surface_data_t> data_;

    std::deque<shell_event_t> queue_;
    bool                      dispatching_{ false };
    bool                      flushing_{ false };

    class dispatch_guard_t {
      shell_t &shell_;

      public:
      explicit dispatch_guard_t(shell_t &shell);
      ~dispatch_guard_t();

      dispatch_guard_t(const dispatch_guard_t &) = delete;
      dispatch_guard_t &
      operator=(const dispatch_guard_t &) = delete;
    };

    /// Run `fn` under the dispatch guard, then deliver what it queued.
    template<typename _Fn>
    auto
    dispatch(_Fn &&fn) {
      if constexpr (std::is_void_v<std::invoke_result_t<_Fn>>) {
        {
          dispatch_guard_t guard(*this);
          fn();
        }
        flush();
      } else {
        auto result = [&] {
          dispatch_guard_t guard(*this);
          return fn();
        }();
        flush();
        return result;
      }
    }

    void
    queue(shell_event_t event);

    void
    flush();

    bool
    has_role(surface_id_t) const;

    bool
    is_abandoned(surface_id_t) const;

    void
    abandon(surface_id_t, const std::string &reason);

    /// Returns false when the configure failed and the surface was
    /// abandoned.
    bool
    send_initial_toplevel_configure(surface_id_t);

    bool
    send_initial_popup_configure(surface_id_t);

    bool
    send_initial_layer_configure(surface_id_t);

    void
    update_mapped(surface_id_t);

    std::shared_ptr<window_t>
    window_for_request(surface_id_t, const char *request);

    public:
    struct {
      signal_t<const shell_event_t &> on_event;
    } events;

    explicit shell_t(protocol_t &protocol, shell_options_t options = {});

    shell_t(const shell_t &) = delete;
    shell_t &
    operator=(const shell_t &) = delete;

    // Role creation.

    void
    new_toplevel(surface_id_t surface);

    void
    new_popup(surface_id_t surface, surface_id_t parent, const positioner_state_t &positioner);

    void
    new_layer_surface(surface_id_t               surface,
                      std::optional<output_id_t> output,
                      layer_t                    layer,
                      const std::string         &namespace_);

    // Surface lifecycle.

    /**
     * @brief Process a `wl_surface.commit`.
     *
     * Imports the buffer, initializes auxiliary state for the whole
     * surface tree, runs the pending initial configures, maps pending
     * toplevels and reconciles resize/move state of mapped windows.
     * `surface_commit_t` is always the last event raised.
     */
    void
    commit(surface_id_t surface);

    /// Drops pending, popup and auxiliary state right away. Mapped
    /// windows and layers stay listed until the next `refresh`.
    void
    surface_destroyed(surface_id_t surface);

    /// Purge every entry whose surface died. Called once per event
    /// loop iteration.
    void
    refresh();

    // Acknowledgements.

    void
    ack_configure(surface_id_t surface, uint32_t serial);

    void
    layer_ack_configure(surface_id_t surface, uint32_t serial);

    /// Apply the placement a layer surface committed. Before the
    /// initial configure its size also becomes the configured size.
    void
    commit_layer_state(surface_id_t surface, const layer_state_t &state);

    // xdg_toplevel requests.

    void
    move_request(surface_id_t surface, seat_id_t seat, uint32_t serial);

    void
    resize_request(surface_id_t surface, seat_id_t seat, uint32_t serial, resize_edge_t edges);

    void
    maximize_request(surface_id_t surface);

    void
    unmaximize_request(surface_id_t surface);

    void
    fullscreen_request(surface_id_t surface, std::optional<output_id_t> output);

    void
    unfullscreen_request(surface_id_t surface);

    void
    minimize_request(surface_id_t surface);

    void
    show_window_menu_request(surface_id_t   surface,
                             seat_id_t      seat,
                             uint32_t       serial,
                             const ipoint_t &location);

    // xdg_popup requests.

    void
    popup_grab_request(surface_id_t surface, seat_id_t seat, uint32_t serial);

    /// `xdg_popup.reposition`; the new geometry is sent right away
    /// once the popup is configured.
    void
    reposition_popup(surface_id_t surface, const positioner_state_t &positioner);

    // Commands issued by the policy layer. Each returns the serial of
    // the configure it sent, or nothing when the surface has no
    // negotiated role or the configure failed.

    std::optional<uint32_t>
    configure_toplevel(surface_id_t surface, const toplevel_state_t &state);

    /// Sends the configure that ends an interactive resize; the
    /// window then waits for the client to ack it.
    std::optional<uint32_t>
    end_resize(surface_id_t surface, const toplevel_state_t &state);

    /// Queue a location to apply together with the commit that
    /// finishes the current resize.
    bool
    move_after_resize(surface_id_t surface, const ipoint_t &target);

    std::optional<uint32_t>
    configure_popup(surface_id_t surface);

    std::optional<uint32_t>
    configure_layer(surface_id_t surface, const ipoint_t &size);

    /// Stage the size used by the layer's next configure without
    /// sending anything.
    bool
    set_layer_size(surface_id_t surface, const ipoint_t &size);

    // Read access.

    const window_list_t &
    windows() const {
      return windows_;
    }

    const layer_list_t &
    layers() const {
      return layers_;
    }

    const pending_list_t &
    pending() const {
      return pending_;
    }

    const popup_tracker_t &
    popups() const {
      return popups_;
    }

    const surface_data_t *
    surface_data(surface_id_t surface) const {
      return data_.find(surface);
    }

    const shell_options_t &
    options() const {
      return options_;
    }
  };
}
