#pragma once

#include "basalt/shell/events.hpp"
#include "basalt/shell/protocol.hpp"
#include "basalt/shell/shell.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace basalt::testing {

  /// In-memory protocol layer. Surfaces are plain records the test
  /// manipulates directly; every configure is recorded.
  class fake_protocol_t : public protocol_t {
    public:
    struct surface_t {
      bool                      alive{ true };
      bool                      buffer{ false };
      bool                      sync{ false };
      bool                      fail_configure{ false };
      std::optional<region_t>   geometry;
      std::vector<surface_id_t> children;
    };

    enum class configure_kind_t { eToplevel, ePopup, eLayer };

    struct configure_t {
      configure_kind_t kind;
      surface_id_t     surface;
      uint32_t         serial;
      toplevel_state_t toplevel;
      region_t         popup;
      ipoint_t         layer{ 0, 0 };
    };

    std::unordered_map<surface_id_t, surface_t> surfaces;
    std::vector<configure_t>                    configures;
    std::vector<surface_id_t>                   imported;

    /// Returned for every grab query when set.
    std::optional<grab_start_data_t> grab;
    /// The surface of the last grab query.
    mutable std::optional<surface_id_t> grab_queried_for;

    uint32_t next_serial{ 100 };

    surface_id_t
    create() {
      surface_id_t id{ .index = next_index_++, .generation = 1 };
      surfaces[id];
      return id;
    }

    /// Give the surface a buffer with the given window geometry.
    void
    attach(surface_id_t id, const region_t &geometry) {
      auto &s    = surfaces.at(id);
      s.buffer   = true;
      s.geometry = geometry;
    }

    void
    kill(surface_id_t id) {
      surfaces.at(id).alive = false;
    }

    size_t
    configures_for(surface_id_t id) const {
      size_t n = 0;
      for (const auto &c : configures)
        if (c.surface == id)
          ++n;
      return n;
    }

    const configure_t &
    last_configure() const {
      return configures.back();
    }

    bool
    alive(surface_id_t id) const override {
      auto it = surfaces.find(id);
      return it != surfaces.end() && it->second.alive;
    }

    bool
    has_buffer(surface_id_t id) const override {
      auto it = surfaces.find(id);
      return it != surfaces.end() && it->second.buffer;
    }

    bool
    is_sync_subsurface(surface_id_t id) const override {
      auto it = surfaces.find(id);
      return it != surfaces.end() && it->second.sync;
    }

    std::vector<surface_id_t>
    surface_tree(surface_id_t id) const override {
      std::vector<surface_id_t> tree;
      collect(id, tree);
      return tree;
    }

    std::optional<region_t>
    window_geometry(surface_id_t id) const override {
      auto it = surfaces.find(id);
      if (it == surfaces.end())
        return std::nullopt;
      return it->second.geometry;
    }

    std::optional<grab_start_data_t>
    grab_start_data(seat_id_t, uint32_t, surface_id_t surface) const override {
      grab_queried_for = surface;
      return grab;
    }

    void
    import_buffer(surface_id_t id) override {
      imported.push_back(id);
    }

    uint32_t
    send_toplevel_configure(surface_id_t id, const toplevel_state_t &state) override {
      check(id);
      configures.push_back({ .kind     = configure_kind_t::eToplevel,
                             .surface  = id,
                             .serial   = next_serial,
                             .toplevel = state });
      return next_serial++;
    }

    uint32_t
    send_popup_configure(surface_id_t id, const region_t &geometry) override {
      check(id);
      configures.push_back(
        { .kind = configure_kind_t::ePopup, .surface = id, .serial = next_serial, .popup = geometry });
      return next_serial++;
    }

    uint32_t
    send_layer_configure(surface_id_t id, const ipoint_t &size) override {
      check(id);
      configures.push_back(
        { .kind = configure_kind_t::eLayer, .surface = id, .serial = next_serial, .layer = size });
      return next_serial++;
    }

    private:
    uint32_t next_index_{ 0 };

    void
    check(surface_id_t id) const {
      if (!alive(id) || surfaces.at(id).fail_configure)
        throw configure_error_t(id, "role object is gone");
    }

    void
    collect(surface_id_t id, std::vector<surface_id_t> &out) const {
      auto it = surfaces.find(id);
      if (it == surfaces.end())
        return;
      out.push_back(id);
      for (auto child : it->second.children)
        collect(child, out);
    }
  };

  /// Records every event the shell emits, in delivery order.
  class event_recorder_t {
    public:
    std::vector<shell_event_t> events;

    explicit event_recorder_t(shell_t &shell) {
      shell.events.on_event.connect([this](const shell_event_t &event) {
        events.push_back(event);
        return signal_action_t::eOk;
      });
    }

    std::vector<std::string>
    names() const {
      std::vector<std::string> result;
      for (const auto &event : events)
        result.emplace_back(event_name(event));
      return result;
    }

    template<typename _Ty>
    std::vector<_Ty>
    of() const {
      std::vector<_Ty> result;
      for (const auto &event : events)
        if (auto *e = std::get_if<_Ty>(&event))
          result.push_back(*e);
      return result;
    }

    void
    clear() {
      events.clear();
    }
  };

}
