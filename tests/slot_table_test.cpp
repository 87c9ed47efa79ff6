#include "basalt/core/slot_table.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace basalt;

TEST(SlotTable, InsertMintsDistinctIds) {
  slot_table_t<std::string> table;
  auto a = table.insert("a");
  auto b = table.insert("b");

  EXPECT_NE(a, b);
  EXPECT_EQ(*table.find(a), "a");
  EXPECT_EQ(*table.find(b), "b");
  EXPECT_EQ(table.size(), 2u);
}

TEST(SlotTable, ReusedSlotGetsNewGeneration) {
  slot_table_t<int> table;
  auto first = table.insert(1);
  ASSERT_TRUE(table.erase(first));

  auto second = table.insert(2);
  EXPECT_EQ(second.index, first.index);
  EXPECT_NE(second.generation, first.generation);

  // The stale id must not see the new occupant.
  EXPECT_EQ(table.find(first), nullptr);
  EXPECT_FALSE(table.erase(first));
  EXPECT_EQ(*table.find(second), 2);
}

TEST(SlotTable, InvalidIdIsNeverFound) {
  slot_table_t<int> table;
  table.insert(1);

  EXPECT_FALSE(table.contains(surface_id_t{}));
  EXPECT_THROW(table.ensure(surface_id_t{}), std::logic_error);
}

TEST(SlotTable, EnsureCreatesOnceAndReplacesStaleOccupant) {
  slot_table_t<int> table;
  surface_id_t      id{ .index = 4, .generation = 7 };

  table.ensure(id, 3) += 1;
  EXPECT_EQ(table.ensure(id, 100), 4);
  EXPECT_EQ(table.size(), 1u);

  surface_id_t newer{ .index = 4, .generation = 8 };
  EXPECT_EQ(table.ensure(newer, 9), 9);
  EXPECT_FALSE(table.contains(id));
  EXPECT_EQ(table.size(), 1u);
}

TEST(SlotTable, RetainDropsRejectedEntries) {
  slot_table_t<int> table;
  auto a = table.insert(1);
  auto b = table.insert(2);
  auto c = table.insert(3);

  auto removed = table.retain([](surface_id_t, const int &value) { return value != 2; });

  EXPECT_EQ(removed, 1u);
  EXPECT_TRUE(table.contains(a));
  EXPECT_FALSE(table.contains(b));
  EXPECT_TRUE(table.contains(c));
}

TEST(SlotTable, WithMutReportsMissingSlot) {
  slot_table_t<int> table;
  surface_id_t      missing{ .index = 0, .generation = 1 };

  EXPECT_FALSE(table.with_mut(missing, [](int &) {}));
  EXPECT_FALSE(table.with_mut(missing, [](int &v) { return v; }).has_value());

  auto id = table.insert(5);
  EXPECT_EQ(table.with_mut(id, [](int &v) { return v * 2; }), 10);
}

TEST(SlotTable, NestedBorrowOfSameSlotThrows) {
  slot_table_t<int> table;
  auto id = table.insert(1);

  EXPECT_THROW(table.with_mut(id, [&](int &) { table.with_mut(id, [](int &) {}); }),
               std::logic_error);

  // The guard was released by the unwinding.
  EXPECT_TRUE(table.with_mut(id, [](int &v) { v = 2; }));
  EXPECT_EQ(*table.find(id), 2);
}

TEST(SlotTable, StructuralChangeWhileBorrowedThrows) {
  slot_table_t<int> table;
  auto a = table.insert(1);
  auto b = table.insert(2);

  EXPECT_THROW(table.with_mut(a, [&](int &) { table.insert(3); }), std::logic_error);
  EXPECT_THROW(table.with_mut(a, [&](int &) { table.erase(b); }), std::logic_error);

  // Borrowing a different slot is fine.
  EXPECT_NO_THROW(table.with_mut(a, [&](int &) { table.with_mut(b, [](int &v) { v = 5; }); }));
  EXPECT_EQ(*table.find(b), 5);
}

TEST(SlotTable, SideTableCyclingOneIndexStaysBounded) {
  slot_table_t<int> table;
  surface_id_t      id{ .index = 0, .generation = 1 };

  for (int i = 0; i < 1000; ++i) {
    table.ensure(id, i);
    ASSERT_TRUE(table.erase(id));
    ++id.generation;
  }

  EXPECT_EQ(table.size(), 0u);
  EXPECT_EQ(table.capacity(), 1u);
  EXPECT_EQ(table.free_slots(), 0u);

  table.ensure({ .index = 3, .generation = 1 }, 1);
  table.ensure({ .index = 5, .generation = 1 }, 2);
  table.retain([](surface_id_t, const int &) { return false; });
  EXPECT_EQ(table.free_slots(), 0u);
}

TEST(SlotTable, ArenaFreeListHoldsEachIndexOnce) {
  slot_table_t<int> table;
  auto a = table.insert(1);
  auto b = table.insert(2);
  ASSERT_TRUE(table.erase(a));
  table.retain([](surface_id_t, const int &) { return false; });

  EXPECT_EQ(table.free_slots(), 2u);
  EXPECT_FALSE(table.contains(b));

  table.insert(3);
  table.insert(4);
  EXPECT_EQ(table.capacity(), 2u);
  EXPECT_EQ(table.free_slots(), 0u);
}
