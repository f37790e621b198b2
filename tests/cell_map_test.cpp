#include <gtest/gtest.h>
#include "CellMap.h"
#include <algorithm>

using namespace GridPlanner;

namespace {
CellRange Range(int minX, int minY, int maxX, int maxY) {
    CellRange range;
    range.minX = minX;
    range.minY = minY;
    range.maxX = maxX;
    range.maxY = maxY;
    return range;
}
} // namespace

TEST(CellMapTest, AbsentCellsReadAsEmpty) {
    CellMap map;
    EXPECT_EQ(map.Get({5, -5}), EMPTY_REGION_ID);
    EXPECT_TRUE(map.Empty());
}

TEST(CellMapTest, WritingEmptyErases) {
    CellMap map;
    map.Set({1, 2}, 7);
    EXPECT_EQ(map.Get({1, 2}), 7u);
    EXPECT_EQ(map.Size(), 1u);
    
    map.Set({1, 2}, EMPTY_REGION_ID);
    EXPECT_EQ(map.Size(), 0u);
    EXPECT_EQ(map.Cells().count({1, 2}), 0u);
}

TEST(CellMapTest, CellsWithRegionFindsEveryMatch) {
    CellMap map;
    map.Set({0, 0}, 1);
    map.Set({3, 4}, 1);
    map.Set({-2, 9}, 2);
    
    auto cells = map.CellsWithRegion(1);
    std::sort(cells.begin(), cells.end());
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_EQ(cells[0], (CellCoord{0, 0}));
    EXPECT_EQ(cells[1], (CellCoord{3, 4}));
    
    EXPECT_TRUE(map.CellsWithRegion(EMPTY_REGION_ID).empty());
}

TEST(CellMapTest, CollectChangesReportsPreviousValues) {
    CellMap map;
    map.Set({1, 0}, 3);
    map.Set({2, 0}, 5);
    
    auto changes = map.CollectChanges(Range(0, 0, 2, 0), 5);
    ASSERT_EQ(changes.size(), 2u);
    std::sort(changes.begin(), changes.end(),
        [](const CellChange& a, const CellChange& b) {
            return a.cell < b.cell;
        });
    EXPECT_EQ(changes[0].cell, (CellCoord{0, 0}));
    EXPECT_EQ(changes[0].previous, EMPTY_REGION_ID);
    EXPECT_EQ(changes[1].cell, (CellCoord{1, 0}));
    EXPECT_EQ(changes[1].previous, 3u);
    
    // Nothing is written
    EXPECT_EQ(map.Get({0, 0}), EMPTY_REGION_ID);
}

TEST(CellMapTest, CollectChangesForEraseOnlyTouchesAssignedCells) {
    CellMap map;
    map.Set({0, 0}, 1);
    map.Set({50, 50}, 2);
    
    auto changes = map.CollectChanges(Range(-1000, -1000, 10, 10),
                                      EMPTY_REGION_ID);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].cell, (CellCoord{0, 0}));
    EXPECT_EQ(changes[0].previous, 1u);
}

TEST(CellMapTest, CollectChangesForEraseOfDenseRangeScansRange) {
    CellMap map;
    for (int x = 0; x < 4; ++x) {
        map.Set({x, 0}, 1);
    }
    
    auto changes = map.CollectChanges(Range(1, 0, 2, 0), EMPTY_REGION_ID);
    EXPECT_EQ(changes.size(), 2u);
}

TEST(CellMapTest, CollectChangesIsEmptyWhenAlreadyFilled) {
    CellMap map;
    map.Set({0, 0}, 4);
    map.Set({0, 1}, 4);
    
    EXPECT_TRUE(map.CollectChanges(Range(0, 0, 0, 1), 4).empty());
    EXPECT_TRUE(CellMap().CollectChanges(Range(0, 0, 3, 3), 
                                         EMPTY_REGION_ID).empty());
}

TEST(CellMapTest, EqualityComparesAssignments) {
    CellMap a;
    CellMap b;
    a.Set({1, 1}, 2);
    EXPECT_NE(a, b);
    b.Set({1, 1}, 2);
    EXPECT_EQ(a, b);
}
