#pragma once

#include "basalt/core/point.hpp"
#include "basalt/core/region.hpp"
#include "basalt/core/surface_id.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace basalt {

  /// Snapshot of the input state that started an interactive grab.
  struct grab_start_data_t {
    seat_id_t    seat;
    uint32_t     serial;
    uint32_t     button;
    fpoint_t     location;
    surface_id_t focus;
  };

  /// Toplevel state proposed in a configure.
  struct toplevel_state_t {
    /// Empty lets the client pick its own size.
    std::optional<ipoint_t> size;

    bool maximized{ false };
    bool fullscreen{ false };
    bool resizing{ false };
    bool activated{ false };

    std::optional<output_id_t> fullscreen_output;
  };

  /// Thrown by the protocol layer when a configure cannot be delivered
  /// (role object gone, client disconnected, ...).
  class configure_error_t : public std::runtime_error {
    public:
    surface_id_t surface;

    configure_error_t(surface_id_t surface, const std::string &what)
      : std::runtime_error(what)
      , surface(surface) {}
  };

  /**
   * @brief Everything the shell needs from the protocol layer.
   *
   * Implemented by `basalt::server_t` on top of libwayland-server, and
   * by fakes in the unit tests.
   */
  class protocol_t {
    public:
    virtual ~protocol_t() = default;

    /// False once the surface (or the role object it was registered
    /// with) has been destroyed.
    virtual bool
    alive(surface_id_t) const = 0;

    virtual bool
    has_buffer(surface_id_t) const = 0;

    virtual bool
    is_sync_subsurface(surface_id_t) const = 0;

    /// The surface followed by all its subsurfaces, parents before
    /// children.
    virtual std::vector<surface_id_t>
    surface_tree(surface_id_t) const = 0;

    /// The visible bounds of the surface, empty while nothing is known
    /// about its size.
    virtual std::optional<region_t>
    window_geometry(surface_id_t) const = 0;

    /// Validate that `serial` belongs to an implicit grab on `seat` that
    /// targets `surface`.
    virtual std::optional<grab_start_data_t>
    grab_start_data(seat_id_t seat, uint32_t serial, surface_id_t surface) const = 0;

    /// Hand the freshly committed buffer to the renderer/importer.
    virtual void
    import_buffer(surface_id_t) = 0;

    // Each returns the serial of the configure, or throws
    // `configure_error_t`.
    virtual uint32_t
    send_toplevel_configure(surface_id_t, const toplevel_state_t &) = 0;

    virtual uint32_t
    send_popup_configure(surface_id_t, const region_t &geometry) = 0;

    virtual uint32_t
    send_layer_configure(surface_id_t, const ipoint_t &size) = 0;
  };

}
