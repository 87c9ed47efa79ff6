#pragma once

#include "basalt/core/point.hpp"
#include "basalt/core/region.hpp"

#include <cstdint>
#include <optional>

namespace basalt {
  /// Numerically identical to `xdg_positioner.anchor`.
  enum class anchor_t : uint32_t {
    eNone        = 0,
    eTop         = 1,
    eBottom      = 2,
    eLeft        = 3,
    eRight       = 4,
    eTopLeft     = 5,
    eBottomLeft  = 6,
    eTopRight    = 7,
    eBottomRight = 8,
  };

  /// Numerically identical to `xdg_positioner.gravity`.
  enum class gravity_t : uint32_t {
    eNone        = 0,
    eTop         = 1,
    eBottom      = 2,
    eLeft        = 3,
    eRight       = 4,
    eTopLeft     = 5,
    eBottomLeft  = 6,
    eTopRight    = 7,
    eBottomRight = 8,
  };

  std::optional<anchor_t>
  anchor_from_wire(uint32_t value);

  std::optional<gravity_t>
  gravity_from_wire(uint32_t value);

  /// Rules set by the client through `xdg_positioner`.
  struct positioner_state_t {
    ipoint_t  size{ 0, 0 };
    region_t  anchor_rect;
    bool      has_anchor_rect{ false };
    anchor_t  anchor{ anchor_t::eNone };
    gravity_t gravity{ gravity_t::eNone };
    uint32_t  constraint_adjustment{ 0 };
    ipoint_t  offset{ 0, 0 };
    bool      reactive{ false };

    std::optional<ipoint_t> parent_size;
    std::optional<uint32_t> parent_configure;

    /// A positioner is only usable once both size and anchor rect
    /// were set.
    bool
    is_complete() const;

    /**
     * @brief Popup geometry relative to the parent's window geometry,
     * before any constraint adjustment.
     */
    region_t
    geometry() const;
  };
}
