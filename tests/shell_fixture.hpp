#pragma once

#include "basalt/shell/shell.hpp"

#include "fake_protocol.hpp"

#include <gtest/gtest.h>

namespace basalt::testing {

  class shell_fixture_t : public ::testing::Test {
    protected:
    fake_protocol_t  protocol;
    shell_t          shell{ protocol };
    event_recorder_t recorder{ shell };

    /// Run a toplevel through the initial configure and its first
    /// buffered commit. The returned window is the one handed out in
    /// `window_created_t`.
    std::shared_ptr<window_t>
    map_toplevel(const region_t &geometry, surface_id_t *id_out = nullptr) {
      auto id = protocol.create();
      shell.new_toplevel(id);
      shell.commit(id);
      protocol.attach(id, geometry);
      shell.commit(id);

      if (id_out)
        *id_out = id;

      auto created = recorder.of<window_created_t>();
      recorder.clear();
      return created.empty() ? nullptr : created.back().window;
    }

    positioner_state_t
    positioner(int32_t x, int32_t y, int32_t w = 40, int32_t h = 20) {
      positioner_state_t p;
      p.size            = { w, h };
      p.anchor_rect     = region_t{ x, y, 0, 0 };
      p.has_anchor_rect = true;
      p.anchor          = anchor_t::eTopLeft;
      p.gravity         = gravity_t::eBottomRight;
      return p;
    }

    grab_start_data_t
    grab_on(surface_id_t focus) {
      return grab_start_data_t{
        .seat = 0, .serial = 1, .button = 0x110, .location = { 12.f, 8.f }, .focus = focus
      };
    }
  };

}
