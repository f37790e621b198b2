#include <gtest/gtest.h>
#include "RegionStore.h"

using namespace GridPlanner;

namespace {
std::vector<std::string> Names(const RegionStore& store) {
    std::vector<std::string> names;
    for (const auto& region : store.GetOrdered(false)) {
        names.push_back(region.name);
    }
    return names;
}

RegionStore MakeStore(std::initializer_list<const char*> names) {
    RegionStore store;
    for (const char* name : names) {
        store.Add(name, Color(0.5f, 0.5f, 0.5f));
    }
    return store;
}
} // namespace

TEST(RegionStoreTest, NewStoreHoldsOnlyEmptyRegion) {
    RegionStore store;
    
    EXPECT_EQ(store.NonEmptyCount(), 0u);
    EXPECT_EQ(store.NextId(), 1u);
    
    const Region* empty = store.Find(EMPTY_REGION_ID);
    ASSERT_NE(empty, nullptr);
    EXPECT_EQ(empty->name, "(Empty)");
    EXPECT_EQ(empty->order, 0);
    EXPECT_FLOAT_EQ(empty->color.a, 0.0f);
}

TEST(RegionStoreTest, AddAssignsIncreasingIdsAndDenseOrders) {
    RegionStore store = MakeStore({"A", "B", "C"});
    
    auto ordered = store.GetOrdered(true);
    ASSERT_EQ(ordered.size(), 4u);
    EXPECT_EQ(ordered[0].id, EMPTY_REGION_ID);
    for (int i = 1; i <= 3; ++i) {
        EXPECT_EQ(ordered[i].id, static_cast<RegionId>(i));
        EXPECT_EQ(ordered[i].order, i);
    }
}

TEST(RegionStoreTest, AddClampsColor) {
    RegionStore store;
    Region region = store.Add("Hot", Color(2.0f, -1.0f, 0.5f, 1.5f));
    
    EXPECT_FLOAT_EQ(region.color.r, 1.0f);
    EXPECT_FLOAT_EQ(region.color.g, 0.0f);
    EXPECT_FLOAT_EQ(region.color.b, 0.5f);
    EXPECT_FLOAT_EQ(region.color.a, 1.0f);
}

TEST(RegionStoreTest, RemoveRenormalizesAndNeverReusesIds) {
    RegionStore store = MakeStore({"A", "B", "C"});
    
    EXPECT_TRUE(store.Remove(2));
    EXPECT_EQ(store.Find(1)->order, 1);
    EXPECT_EQ(store.Find(3)->order, 2);
    EXPECT_EQ(store.NextId(), 4u);
    
    Region d = store.Add("D", Color());
    EXPECT_EQ(d.id, 4u);
    EXPECT_EQ(d.order, 3);
}

TEST(RegionStoreTest, EmptyRegionCannotBeRemoved) {
    RegionStore store = MakeStore({"A"});
    
    EXPECT_FALSE(store.Remove(EMPTY_REGION_ID));
    EXPECT_FALSE(store.Remove(42));
    EXPECT_TRUE(store.Contains(EMPTY_REGION_ID));
}

TEST(RegionStoreTest, InsertRestoresCapturedPosition) {
    RegionStore store = MakeStore({"A", "B", "C"});
    Region b = *store.Find(2);
    
    store.Remove(2);
    EXPECT_EQ(Names(store), (std::vector<std::string>{"A", "C"}));
    
    EXPECT_TRUE(store.Insert(b));
    EXPECT_EQ(Names(store), (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(store.Find(3)->order, 3);
}

TEST(RegionStoreTest, InsertRaisesIdHighWaterMark) {
    RegionStore store = MakeStore({"A"});
    
    Region restored;
    restored.id = 10;
    restored.name = "Restored";
    restored.order = 0;
    EXPECT_TRUE(store.Insert(restored));
    EXPECT_EQ(store.NextId(), 11u);
    EXPECT_EQ(Names(store), (std::vector<std::string>{"A", "Restored"}));
}

TEST(RegionStoreTest, InsertRejectsEmptyAndDuplicates) {
    RegionStore store = MakeStore({"A"});
    
    Region duplicate = *store.Find(1);
    EXPECT_FALSE(store.Insert(duplicate));
    
    Region empty;
    empty.id = EMPTY_REGION_ID;
    EXPECT_FALSE(store.Insert(empty));
    EXPECT_EQ(store.NonEmptyCount(), 1u);
}

TEST(RegionStoreTest, ComputeMoveOrdersUsesFractionalNudge) {
    RegionStore store = MakeStore({"A", "B", "C", "D"});
    
    // C up one: 3 - 1 - 0.5 = 1.5, lands between A and B
    OrderMap up = store.ComputeMoveOrders(3, -1);
    EXPECT_EQ(up.at(1), 1);
    EXPECT_EQ(up.at(3), 2);
    EXPECT_EQ(up.at(2), 3);
    EXPECT_EQ(up.at(4), 4);
    
    // A down one: 1 + 1 + 0.5 = 2.5, lands between B and C
    OrderMap down = store.ComputeMoveOrders(1, 1);
    EXPECT_EQ(down.at(2), 1);
    EXPECT_EQ(down.at(1), 2);
    EXPECT_EQ(down.at(3), 3);
    EXPECT_EQ(down.at(4), 4);
    
    // Far past the end clamps to last
    OrderMap last = store.ComputeMoveOrders(1, 10);
    EXPECT_EQ(last.at(1), 4);
    
    // Does not touch the live store
    EXPECT_EQ(store.Find(1)->order, 1);
}

TEST(RegionStoreTest, ComputeMoveOrdersAtEdgesIsUnchanged) {
    RegionStore store = MakeStore({"A", "B", "C"});
    
    EXPECT_EQ(store.ComputeMoveOrders(1, -1), store.GetOrders());
    EXPECT_EQ(store.ComputeMoveOrders(3, 1), store.GetOrders());
    EXPECT_EQ(store.ComputeMoveOrders(2, 0), store.GetOrders());
}

TEST(RegionStoreTest, ApplyOrdersSkipsMissingRegions) {
    RegionStore store = MakeStore({"A", "B"});
    
    OrderMap orders = {{1, 2}, {2, 1}, {99, 3}};
    EXPECT_EQ(store.ApplyOrders(orders), 1);
    store.Normalize();
    EXPECT_EQ(Names(store), (std::vector<std::string>{"B", "A"}));
}

TEST(RegionStoreTest, SetNextIdNeverGoesBelowExistingIds) {
    RegionStore store = MakeStore({"A", "B", "C"});
    
    store.SetNextId(1);
    EXPECT_EQ(store.NextId(), 4u);
    
    store.SetNextId(20);
    EXPECT_EQ(store.NextId(), 20u);
    EXPECT_EQ(store.Add("D", Color()).id, 20u);
}

TEST(RegionStoreTest, ClearRestartsIds) {
    RegionStore store = MakeStore({"A", "B"});
    store.Clear();
    
    EXPECT_EQ(store.NonEmptyCount(), 0u);
    EXPECT_EQ(store.NextId(), 1u);
    EXPECT_TRUE(store.Contains(EMPTY_REGION_ID));
}
