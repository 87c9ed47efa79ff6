#include "basalt/shell/positioner.hpp"

namespace basalt {

  namespace {
    bool
    has_top(anchor_t a) {
      return a == anchor_t::eTop || a == anchor_t::eTopLeft || a == anchor_t::eTopRight;
    }

    bool
    has_bottom(anchor_t a) {
      return a == anchor_t::eBottom || a == anchor_t::eBottomLeft || a == anchor_t::eBottomRight;
    }

    bool
    has_left(anchor_t a) {
      return a == anchor_t::eLeft || a == anchor_t::eTopLeft || a == anchor_t::eBottomLeft;
    }

    bool
    has_right(anchor_t a) {
      return a == anchor_t::eRight || a == anchor_t::eTopRight || a == anchor_t::eBottomRight;
    }

    // Gravity shares its edge layout with the anchor enumeration.
    anchor_t
    as_anchor(gravity_t g) {
      return static_cast<anchor_t>(g);
    }
  }

  std::optional<anchor_t>
  anchor_from_wire(uint32_t value) {
    if (value > static_cast<uint32_t>(anchor_t::eBottomRight))
      return std::nullopt;
    return static_cast<anchor_t>(value);
  }

  std::optional<gravity_t>
  gravity_from_wire(uint32_t value) {
    if (value > static_cast<uint32_t>(gravity_t::eBottomRight))
      return std::nullopt;
    return static_cast<gravity_t>(value);
  }

  bool
  positioner_state_t::is_complete() const {
    return size.x > 0 && size.y > 0 && has_anchor_rect;
  }

  region_t
  positioner_state_t::geometry() const {
    region_t geometry(offset, size);

    // Move to the anchor point on the anchor rectangle. An axis without
    // an anchor edge anchors at the centre.
    if (has_top(anchor))
      geometry.y += anchor_rect.y;
    else if (has_bottom(anchor))
      geometry.y += anchor_rect.y + anchor_rect.h;
    else
      geometry.y += anchor_rect.y + anchor_rect.h / 2;

    if (has_left(anchor))
      geometry.x += anchor_rect.x;
    else if (has_right(anchor))
      geometry.x += anchor_rect.x + anchor_rect.w;
    else
      geometry.x += anchor_rect.x + anchor_rect.w / 2;

    // Gravity decides in which direction the popup grows away from
    // the anchor point.
    auto g = as_anchor(gravity);
    if (has_top(g))
      geometry.y -= geometry.h;
    else if (!has_bottom(g))
      geometry.y -= geometry.h / 2;

    if (has_left(g))
      geometry.x -= geometry.w;
    else if (!has_right(g))
      geometry.x -= geometry.w / 2;

    return geometry;
  }

}
