#include "basalt/core/serial_queue.hpp"
#include "basalt/shell/layer.hpp"

#include <gtest/gtest.h>

using namespace basalt;

TEST(SerialQueue, AckRetiresOlderEntries) {
  serial_queue_t<uint32_t> serials;
  serials.push(10);
  serials.push(11);
  serials.push(12);

  EXPECT_EQ(serials.ack(11), 11u);
  ASSERT_EQ(serials.size(), 1u);
  EXPECT_EQ(serials[0], 12u);

  // Already retired.
  EXPECT_FALSE(serials.ack(10));
}

TEST(SerialQueue, NeverAckingClientStaysBounded) {
  serial_queue_t<layer_configure_t> configures;
  constexpr auto                    cap = serial_queue_t<layer_configure_t>::MAX_PENDING;

  for (uint32_t serial = 1; serial <= cap * 10; ++serial)
    configures.push({ .serial = serial, .size = { 1, 1 } });

  ASSERT_EQ(configures.size(), cap);
  EXPECT_EQ(configures[0].serial, cap * 9 + 1);

  // The dropped ones are unknown now, the newest still acks.
  EXPECT_FALSE(configures.ack(1));
  auto newest = configures.ack(cap * 10);
  ASSERT_TRUE(newest);
  EXPECT_EQ(newest->serial, cap * 10);
  EXPECT_TRUE(configures.empty());
}
