#pragma once

#include "basalt/core/point.hpp"
#include "basalt/core/serial_queue.hpp"
#include "basalt/core/surface_id.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace basalt {
  /// Stacking layers, numerically identical to `zwlr_layer_shell_v1.layer`.
  enum class layer_t : uint32_t {
    eBackground = 0,
    eBottom     = 1,
    eTop        = 2,
    eOverlay    = 3,
  };

  std::optional<layer_t>
  layer_from_wire(uint32_t value);

  const char *
  to_string(layer_t layer);

  /// One configure sent to a layer surface.
  struct layer_configure_t {
    uint32_t serial;
    ipoint_t size;

    bool
    operator==(const layer_configure_t &) const = default;
  };

  struct layer_margin_t {
    int32_t top{ 0 }, right{ 0 }, bottom{ 0 }, left{ 0 };

    bool
    operator==(const layer_margin_t &) const = default;
  };

  /// Placement requested by the client, as of its last commit.
  struct layer_state_t {
    ipoint_t       size{ 0, 0 };
    uint32_t       anchor{ 0 };
    int32_t        exclusive_zone{ 0 };
    layer_margin_t margin;
    uint32_t       keyboard_interactivity{ 0 };
    layer_t        layer{ layer_t::eBackground };

    bool
    operator==(const layer_state_t &) const = default;
  };

  struct layer_entry_t {
    surface_id_t               surface;
    std::string                namespace_;
    layer_t                    layer;
    std::optional<output_id_t> output;

    layer_state_t state;

    bool initial_configure_sent{ false };

    /// Size used by the next configure; staged by the policy layer.
    ipoint_t pending_size{ 0, 0 };

    serial_queue_t<layer_configure_t> outstanding;

    std::optional<layer_configure_t> last_acked;

    layer_entry_t(surface_id_t               surface,
                  std::string                namespace_,
                  layer_t                    layer,
                  std::optional<output_id_t> output)
      : surface(surface)
      , namespace_(std::move(namespace_))
      , layer(layer)
      , output(output) {
      state.layer = layer;
    }
  };
}
