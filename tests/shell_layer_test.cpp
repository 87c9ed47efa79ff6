#include "basalt/shell/shell.hpp"

#include "shell_fixture.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace basalt;
using basalt::testing::event_recorder_t;
using basalt::testing::fake_protocol_t;
using basalt::testing::shell_fixture_t;

using names_t = std::vector<std::string>;

class ShellLayers : public shell_fixture_t {
  protected:
  surface_id_t
  new_layer(const char *namespace_ = "panel") {
    auto id = protocol.create();
    shell.new_layer_surface(id, std::nullopt, layer_t::eTop, namespace_);
    return id;
  }
};

TEST_F(ShellLayers, CreationIsReportedRightAway) {
  auto id = new_layer("wallpaper");

  auto created = recorder.of<layer_created_t>();
  ASSERT_EQ(created.size(), 1u);
  EXPECT_EQ(created[0].layer_surface->surface, id);
  EXPECT_EQ(created[0].layer, layer_t::eTop);
  EXPECT_EQ(created[0].namespace_, "wallpaper");
  EXPECT_FALSE(created[0].output);

  EXPECT_TRUE(shell.layers().contains(id));
  EXPECT_TRUE(protocol.configures.empty());
}

TEST_F(ShellLayers, InitialConfigureUsesStagedSizeOnce) {
  auto id = new_layer();
  EXPECT_TRUE(shell.set_layer_size(id, { 1920, 32 }));

  shell.commit(id);
  shell.commit(id);

  ASSERT_EQ(protocol.configures_for(id), 1u);
  EXPECT_EQ(protocol.last_configure().layer, (ipoint_t{ 1920, 32 }));

  auto layer = shell.layers().find(id);
  EXPECT_TRUE(layer->initial_configure_sent);
  ASSERT_EQ(layer->outstanding.size(), 1u);
  EXPECT_EQ(layer->outstanding[0].serial, protocol.last_configure().serial);
}

TEST_F(ShellLayers, MatchingAckIsForwarded) {
  auto id = new_layer();
  shell.set_layer_size(id, { 100, 40 });
  shell.commit(id);
  auto serial = protocol.last_configure().serial;
  recorder.clear();

  shell.layer_ack_configure(id, serial);

  auto acks = recorder.of<layer_ack_configure_t>();
  ASSERT_EQ(acks.size(), 1u);
  EXPECT_EQ(acks[0].configure, (layer_configure_t{ serial, { 100, 40 } }));

  auto layer = shell.layers().find(id);
  EXPECT_TRUE(layer->outstanding.empty());
  EXPECT_EQ(layer->last_acked, (layer_configure_t{ serial, { 100, 40 } }));
}

TEST_F(ShellLayers, AckingNewerConfigureRetiresOlderOnes) {
  auto id = new_layer();
  shell.commit(id);
  shell.configure_layer(id, { 10, 10 });
  auto newest = shell.configure_layer(id, { 20, 20 });
  ASSERT_TRUE(newest);
  EXPECT_EQ(shell.layers().find(id)->outstanding.size(), 3u);

  shell.layer_ack_configure(id, *newest);
  EXPECT_TRUE(shell.layers().find(id)->outstanding.empty());
  EXPECT_EQ(recorder.of<layer_ack_configure_t>().back().configure.size, (ipoint_t{ 20, 20 }));
}

TEST_F(ShellLayers, UnknownSerialIsDroppedWhenStrict) {
  auto id = new_layer();
  shell.commit(id);
  recorder.clear();

  shell.layer_ack_configure(id, 9999);

  EXPECT_TRUE(recorder.events.empty());
  EXPECT_FALSE(shell.layers().find(id)->last_acked);
  EXPECT_EQ(shell.layers().find(id)->outstanding.size(), 1u);
}

TEST(ShellLayersLenient, UnknownSerialIsForwardedWithZeroSize) {
  fake_protocol_t  protocol;
  shell_t          shell(protocol, shell_options_t{ .strict_layer_acks = false });
  event_recorder_t recorder(shell);

  auto id = protocol.create();
  shell.new_layer_surface(id, 1u, layer_t::eOverlay, "osd");
  shell.commit(id);
  recorder.clear();

  shell.layer_ack_configure(id, 9999);

  auto acks = recorder.of<layer_ack_configure_t>();
  ASSERT_EQ(acks.size(), 1u);
  EXPECT_EQ(acks[0].configure, (layer_configure_t{ 9999, { 0, 0 } }));
  EXPECT_EQ(shell.layers().find(id)->output, 1u);
}

TEST_F(ShellLayers, ConfigureNeedsInitialConfigure) {
  auto id = new_layer();
  EXPECT_FALSE(shell.configure_layer(id, { 5, 5 }));

  shell.commit(id);
  auto serial = shell.configure_layer(id, { 5, 5 });
  ASSERT_TRUE(serial);
  EXPECT_EQ(shell.layers().find(id)->pending_size, (ipoint_t{ 5, 5 }));
}

TEST_F(ShellLayers, UnknownSurfaceIsIgnored) {
  auto id = protocol.create();

  EXPECT_FALSE(shell.set_layer_size(id, { 1, 1 }));
  EXPECT_FALSE(shell.configure_layer(id, { 1, 1 }));
  shell.layer_ack_configure(id, 1);
  EXPECT_TRUE(recorder.events.empty());
}

TEST_F(ShellLayers, FailedInitialConfigureAbandonsLayer) {
  auto id                              = new_layer();
  protocol.surfaces[id].fail_configure = true;
  recorder.clear();

  shell.commit(id);

  EXPECT_EQ(recorder.names(), (names_t{ "surface_abandoned", "surface_commit" }));
  EXPECT_FALSE(shell.layers().contains(id));
}

TEST_F(ShellLayers, RefreshDropsDeadLayers) {
  auto keep = new_layer("a");
  auto gone = new_layer("b");
  protocol.kill(gone);

  shell.refresh();

  EXPECT_TRUE(shell.layers().contains(keep));
  EXPECT_FALSE(shell.layers().contains(gone));
}

TEST_F(ShellLayers, CommittedStateReachesTheEntry) {
  auto id = new_layer();

  layer_state_t state;
  state.size           = { 0, 30 };
  state.anchor         = 13;
  state.exclusive_zone = 30;
  state.margin         = { .top = 4, .right = 0, .bottom = 0, .left = 8 };
  state.layer          = layer_t::eOverlay;
  shell.commit_layer_state(id, state);
  shell.commit(id);

  auto layer = shell.layers().find(id);
  EXPECT_EQ(layer->layer, layer_t::eOverlay);
  EXPECT_EQ(layer->state, state);
  EXPECT_EQ(protocol.last_configure().layer, (ipoint_t{ 0, 30 }));
}

TEST_F(ShellLayers, LayerChangeAfterConfigureKeepsConfiguredSize) {
  auto id = new_layer();
  shell.set_layer_size(id, { 1920, 32 });
  shell.commit(id);

  layer_state_t state;
  state.size  = { 10, 10 };
  state.layer = layer_t::eBottom;
  shell.commit_layer_state(id, state);

  auto layer = shell.layers().find(id);
  EXPECT_EQ(layer->layer, layer_t::eBottom);
  EXPECT_EQ(layer->state.size, (ipoint_t{ 10, 10 }));
  EXPECT_EQ(layer->pending_size, (ipoint_t{ 1920, 32 }));
  EXPECT_EQ(protocol.configures_for(id), 1u);
}

TEST_F(ShellLayers, StateForUnknownSurfaceIsIgnored) {
  auto id = protocol.create();
  EXPECT_NO_THROW(shell.commit_layer_state(id, layer_state_t{}));
  EXPECT_FALSE(shell.layers().contains(id));
}
