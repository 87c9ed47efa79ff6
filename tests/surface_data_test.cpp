#include "basalt/shell/surface_data.hpp"

#include <gtest/gtest.h>

using namespace basalt;

namespace {
  surface_data_t
  resizing_from(resize_edge_t edges, ipoint_t location, ipoint_t size) {
    surface_data_t data;
    data.resize_state = resizing_t{ { .edges                   = edges,
                                      .initial_window_location = location,
                                      .initial_window_size     = size } };
    return data;
  }
}

TEST(ResizeEdge, AcceptsEdgesAndCornersOnly) {
  EXPECT_EQ(resize_edge_from_wire(1), resize_edge_t::eTop);
  EXPECT_EQ(resize_edge_from_wire(10), resize_edge_t::eBottomRight);
  EXPECT_EQ(resize_edge_from_wire(5), resize_edge_t::eTopLeft);

  EXPECT_FALSE(resize_edge_from_wire(0));
  EXPECT_FALSE(resize_edge_from_wire(3));  // top|bottom
  EXPECT_FALSE(resize_edge_from_wire(12)); // left|right
  EXPECT_FALSE(resize_edge_from_wire(11));
  EXPECT_FALSE(resize_edge_from_wire(16));
}

TEST(SurfaceData, LeftResizeKeepsRightEdge) {
  auto data   = resizing_from(resize_edge_t::eLeft, { 10, 20 }, { 100, 50 });
  auto update = data.on_commit({ 80, 50 });

  EXPECT_EQ(update.x, 30);
  EXPECT_FALSE(update.y);
  EXPECT_TRUE(std::holds_alternative<resizing_t>(data.resize_state));
}

TEST(SurfaceData, TopLeftResizeMovesBothAxes) {
  auto data   = resizing_from(resize_edge_t::eTopLeft, { 0, 0 }, { 200, 200 });
  auto update = data.on_commit({ 150, 150 });

  EXPECT_EQ(update.x, 50);
  EXPECT_EQ(update.y, 50);
}

TEST(SurfaceData, BottomRightResizeReportsNothing) {
  auto data   = resizing_from(resize_edge_t::eBottomRight, { 5, 5 }, { 200, 200 });
  auto update = data.on_commit({ 300, 250 });

  EXPECT_FALSE(update.changed());
}

TEST(SurfaceData, WaitingForCommitFinishesOnce) {
  surface_data_t data;
  data.resize_state = waiting_for_commit_t{
    { .edges = resize_edge_t::eTop, .initial_window_location = { 0, 100 }, .initial_window_size = { 50, 50 } }
  };

  auto update = data.on_commit({ 50, 40 });
  EXPECT_EQ(update.y, 110);
  EXPECT_TRUE(std::holds_alternative<not_resizing_t>(data.resize_state));

  auto again = data.on_commit({ 50, 30 });
  EXPECT_FALSE(again.changed());
}

TEST(SurfaceData, WaitingForFinalAckStillAdjusts) {
  surface_data_t data;
  data.resize_state = waiting_for_final_ack_t{
    .data = { .edges = resize_edge_t::eLeft, .initial_window_location = { 0, 0 }, .initial_window_size = { 100, 100 } },
    .serial = 7
  };

  auto update = data.on_commit({ 90, 100 });
  EXPECT_EQ(update.x, 10);
  EXPECT_TRUE(std::holds_alternative<waiting_for_final_ack_t>(data.resize_state));
}

TEST(SurfaceData, MoveAfterResizeAppliesOnNextCommitOnly) {
  auto data = resizing_from(resize_edge_t::eLeft, { 10, 20 }, { 100, 50 });
  data.resize_state = waiting_for_commit_t{ active_resize(data.resize_state).value() };
  data.move_after_resize_state = move_waiting_for_commit_t{ { 400, 300 } };

  auto update = data.on_commit({ 80, 50 });
  EXPECT_EQ(update.x, 400);
  EXPECT_EQ(update.y, 300);
  EXPECT_TRUE(std::holds_alternative<not_resizing_t>(data.resize_state));

  auto *current = std::get_if<move_current_t>(&data.move_after_resize_state);
  ASSERT_NE(current, nullptr);
  EXPECT_EQ(current->target_window_location, (ipoint_t{ 400, 300 }));

  EXPECT_FALSE(data.on_commit({ 80, 50 }).changed());
}

TEST(Serial, ComparisonHandlesWrapAround) {
  EXPECT_TRUE(serial_not_older(5, 5));
  EXPECT_TRUE(serial_not_older(6, 5));
  EXPECT_FALSE(serial_not_older(4, 5));
  EXPECT_TRUE(serial_not_older(2, 0xfffffff0u));
  EXPECT_FALSE(serial_not_older(0xfffffff0u, 2));
}
