#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <limits>
#include <string_view>

namespace basalt {
  /// Stable identity of a client surface. `index` addresses a slot in
  /// the owning arena, `generation` tells apart successive occupants
  /// of the same slot.
  struct surface_id_t {
    static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

    uint32_t index{ INVALID_INDEX };
    uint32_t generation{};

    bool
    valid() const {
      return index != INVALID_INDEX;
    }

    bool
    operator==(const surface_id_t &) const = default;
  };

  using seat_id_t   = uint32_t;
  using output_id_t = uint32_t;
}

template<>
struct std::hash<basalt::surface_id_t> {
  size_t
  operator()(const basalt::surface_id_t &id) const noexcept {
    return std::hash<uint64_t>{}((static_cast<uint64_t>(id.generation) << 32) | id.index);
  }
};

template<>
struct std::formatter<basalt::surface_id_t> : std::formatter<std::string_view> {
  auto
  format(const basalt::surface_id_t &id, std::format_context &ctx) const {
    if (!id.valid())
      return std::format_to(ctx.out(), "surface#invalid");
    return std::format_to(ctx.out(), "surface#{}.{}", id.index, id.generation);
  }
};
