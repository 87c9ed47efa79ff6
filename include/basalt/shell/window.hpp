#pragma once

#include "basalt/core/point.hpp"
#include "basalt/core/region.hpp"
#include "basalt/core/surface_id.hpp"

namespace basalt {
  /// A mapped toplevel.
  struct window_t {
    surface_id_t surface;

    /// Placement in the compositor's logical space. Owned by the
    /// policy layer; the shell never writes it after mapping, it only
    /// reports where it should go (`window_got_resized_t`).
    ipoint_t location{ 0, 0 };

    /// Client-provided window geometry (surface local), refreshed on
    /// every commit.
    region_t geometry;

    explicit window_t(surface_id_t surface, const region_t &geometry)
      : surface(surface)
      , geometry(geometry) {}

    ipoint_t
    size() const {
      return geometry.size();
    }
  };
}
