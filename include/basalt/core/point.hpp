#pragma once

#include <cfloat>
#include <cmath>
#include <cstdint>
#include <type_traits>

namespace basalt {

  /// A position or a size, in logical coordinates.
  template<typename _Ty>
    requires std::is_scalar_v<_Ty>
  struct point_t {
    using type = _Ty;
    _Ty x, y;

    template<typename _PTy>
    bool
    operator==(const point_t<_PTy> &other) const {
      if constexpr (std::is_floating_point_v<_PTy> || std::is_floating_point_v<_Ty>) {
        return std::abs(x - other.x) <= FLT_EPSILON && std::abs(y - other.y) <= FLT_EPSILON;
      } else {
        return x == other.x && y == other.y;
      }
    }

    /// Buffer pixels to surface-local units.
    point_t<_Ty>
    operator/(_Ty scale) const {
      return point_t<_Ty>{ x / scale, y / scale };
    }
  };

  using fpoint_t = point_t<float>;
  using ipoint_t = point_t<int32_t>;
}
