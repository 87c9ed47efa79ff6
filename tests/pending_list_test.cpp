#include "basalt/shell/pending_list.hpp"

#include "fake_protocol.hpp"

#include <gtest/gtest.h>

using namespace basalt;
using basalt::testing::fake_protocol_t;

TEST(PendingList, NotPromotedWithoutBuffer) {
  fake_protocol_t protocol;
  pending_list_t  pending;

  auto surface = protocol.create();
  pending.insert(surface);

  EXPECT_EQ(pending.try_promote(surface, protocol), nullptr);
  EXPECT_TRUE(pending.contains(surface));
}

TEST(PendingList, PromotesExactlyOnce) {
  fake_protocol_t protocol;
  pending_list_t  pending;

  auto surface = protocol.create();
  pending.insert(surface);
  protocol.attach(surface, region_t{ 5, 5, 640, 480 });

  auto window = pending.try_promote(surface, protocol);
  ASSERT_NE(window, nullptr);
  EXPECT_EQ(window->surface, surface);
  EXPECT_EQ(window->location, (ipoint_t{ 0, 0 }));
  EXPECT_EQ(window->size(), (ipoint_t{ 640, 480 }));
  EXPECT_FALSE(pending.contains(surface));

  EXPECT_EQ(pending.try_promote(surface, protocol), nullptr);
}

TEST(PendingList, UnknownSurfaceIsNeverPromoted) {
  fake_protocol_t protocol;
  pending_list_t  pending;

  auto surface = protocol.create();
  protocol.attach(surface, region_t{ 0, 0, 1, 1 });
  EXPECT_EQ(pending.try_promote(surface, protocol), nullptr);
}

TEST(PendingList, RefreshDropsDeadEntries) {
  fake_protocol_t protocol;
  pending_list_t  pending;

  auto alive = protocol.create();
  auto dead  = protocol.create();
  pending.insert(alive);
  pending.insert(dead);
  protocol.kill(dead);

  EXPECT_EQ(pending.refresh(protocol), 1u);
  EXPECT_TRUE(pending.contains(alive));
  EXPECT_FALSE(pending.contains(dead));
}
