#include "basalt/shell/layer.hpp"

namespace basalt {

  std::optional<layer_t>
  layer_from_wire(uint32_t value) {
    if (value > static_cast<uint32_t>(layer_t::eOverlay))
      return std::nullopt;
    return static_cast<layer_t>(value);
  }

  const char *
  to_string(layer_t layer) {
    switch (layer) {
      case layer_t::eBackground:
        return "background";
      case layer_t::eBottom:
        return "bottom";
      case layer_t::eTop:
        return "top";
      case layer_t::eOverlay:
        return "overlay";
    }
    return "invalid";
  }

}
