#pragma once

#include "basalt/core/point.hpp"
#include <cstdint>

namespace basalt {
  /// Axis aligned rectangle in logical coordinates.
  struct region_t {
    int32_t x{}, y{}, w{}, h{};

    region_t() = default;
    region_t(int32_t x, int32_t y, int32_t w, int32_t h)
      : x(x)
      , y(y)
      , w(w)
      , h(h) {}

    region_t(const ipoint_t &position, const ipoint_t &size)
      : x(position.x)
      , y(position.y)
      , w(size.x)
      , h(size.y) {}

    ipoint_t
    position() const {
      return { x, y };
    }

    ipoint_t
    size() const {
      return { w, h };
    }

    bool
    empty() const {
      return w <= 0 || h <= 0;
    }

    bool
    intersects(int32_t px, int32_t py) const {
      return px >= x && py >= y && px < x + w && py < y + h;
    }

    bool
    operator==(const region_t &other) const {
      return x == other.x && y == other.y && w == other.w && h == other.h;
    }
  };
}
