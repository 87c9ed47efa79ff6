#include "basalt/shell/events.hpp"

#include <gtest/gtest.h>
#include <format>
#include <string>

using namespace basalt;

TEST(Events, NamesAreStable) {
  surface_id_t id{ .index = 0, .generation = 1 };

  EXPECT_STREQ(event_name(surface_commit_t{ id }), "surface_commit");
  EXPECT_STREQ(event_name(window_created_t{ nullptr }), "window_created");
  EXPECT_STREQ(event_name(layer_ack_configure_t{ .surface = id, .configure = { 1, { 0, 0 } } }),
               "layer_ack_configure");
  EXPECT_STREQ(event_name(surface_abandoned_t{ .surface = id, .reason = "gone" }),
               "surface_abandoned");
}

TEST(Events, SurfaceIdFormatting) {
  EXPECT_EQ(std::format("{}", surface_id_t{ .index = 3, .generation = 2 }), "surface#3.2");
  EXPECT_EQ(std::format("{}", surface_id_t{}), "surface#invalid");
}

TEST(Events, NamesFollowTheVariantOrder) {
  surface_id_t id{ .index = 0, .generation = 1 };

  EXPECT_STREQ(event_name(window_minimize_t{ nullptr }), "window_minimize");
  EXPECT_STREQ(event_name(layer_created_t{ .layer_surface = nullptr,
                                           .output        = std::nullopt,
                                           .layer         = layer_t::eTop,
                                           .namespace_    = "panel" }),
               "layer_created");
  EXPECT_STREQ(event_name(surface_commit_t{ id }), "surface_commit");
}
