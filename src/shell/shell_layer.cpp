#include "basalt/shell/shell.hpp"

#include "../log.hpp"

namespace basalt {

  void
  shell_t::new_layer_surface(surface_id_t               surface,
                             std::optional<output_id_t> output,
                             layer_t                    layer,
                             const std::string         &namespace_) {
    dispatch([&] {
      if (has_role(surface) || is_abandoned(surface)) {
        WARN("{} already has a shell role, ignoring new layer surface", surface);
        return;
      }

      auto entry = std::make_shared<layer_entry_t>(surface, namespace_, layer, output);
      layers_.insert(entry);
      data_.ensure(surface);

      INFO("New layer surface {} '{}' on layer {}", surface, namespace_, to_string(layer));
      queue(layer_created_t{
        .layer_surface = entry, .output = output, .layer = layer, .namespace_ = namespace_ });
    });
  }

  void
  shell_t::layer_ack_configure(surface_id_t surface, uint32_t serial) {
    dispatch([&] {
      auto layer = layers_.find_mut(surface);
      if (!layer) {
        TRACE("Ignoring layer ack_configure({}) for unknown {}", serial, surface);
        return;
      }

      layer_configure_t configure{ .serial = serial, .size = { 0, 0 } };
      if (auto acked = layer->outstanding.ack(serial)) {
        configure = *acked;
      } else if (options_.strict_layer_acks) {
        WARN("Layer surface {} acked unknown serial {}, dropping", surface, serial);
        return;
      }

      layer->last_acked = configure;
      queue(layer_ack_configure_t{ .surface = surface, .configure = configure });
    });
  }

  void
  shell_t::commit_layer_state(surface_id_t surface, const layer_state_t &state) {
    dispatch([&] {
      auto layer = layers_.find_mut(surface);
      if (!layer) {
        TRACE("Ignoring layer state for unknown {}", surface);
        return;
      }

      if (state.layer != layer->layer)
        INFO("Layer surface {} moved from {} to {}",
             surface,
             to_string(layer->layer),
             to_string(state.layer));

      layer->state = state;
      layer->layer = state.layer;
      if (!layer->initial_configure_sent)
        layer->pending_size = state.size;
    });
  }

  std::optional<uint32_t>
  shell_t::configure_layer(surface_id_t surface, const ipoint_t &size) {
    return dispatch([&]() -> std::optional<uint32_t> {
      auto layer = layers_.find_mut(surface);
      if (!layer || !layer->initial_configure_sent) {
        TRACE("Refusing to configure {}, role not negotiated", surface);
        return std::nullopt;
      }

      try {
        auto serial         = protocol_.send_layer_configure(surface, size);
        layer->pending_size = size;
        layer->outstanding.push({ .serial = serial, .size = size });
        return serial;
      } catch (const configure_error_t &e) {
        ERROR("Failed to configure layer surface {}: {}", surface, e.what());
        return std::nullopt;
      }
    });
  }

  bool
  shell_t::set_layer_size(surface_id_t surface, const ipoint_t &size) {
    return dispatch([&] {
      auto layer = layers_.find_mut(surface);
      if (!layer) {
        TRACE("Ignoring layer size for unknown {}", surface);
        return false;
      }

      layer->pending_size = size;
      return true;
    });
  }

}
