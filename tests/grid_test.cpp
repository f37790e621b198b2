#include <gtest/gtest.h>
#include "Grid.h"
#include <cmath>
#include <limits>
#include <optional>

using namespace GridPlanner;

namespace {
GridDescriptor MakeGrid(double w, double h, double xo = 0.0, double yo = 0.0) {
    GridDescriptor grid;
    grid.width = w;
    grid.height = h;
    grid.xOffset = xo;
    grid.yOffset = yo;
    return grid;
}
} // namespace

TEST(GridTest, CellOfFloorsNegativeCoordinates) {
    GridDescriptor grid = MakeGrid(32, 32);
    
    EXPECT_EQ(CellOf(grid, -1.0, 0.0).x, -1);
    EXPECT_EQ(CellOf(grid, 0.0, 0.0).x, 0);
    EXPECT_EQ(CellOf(grid, 31.999, 0.0).x, 0);
    EXPECT_EQ(CellOf(grid, 32.0, 0.0).x, 1);
    EXPECT_EQ(CellOf(grid, -32.0, 0.0).x, -1);
    EXPECT_EQ(CellOf(grid, -32.5, 0.0).x, -2);
    EXPECT_EQ(CellOf(grid, 0.0, -0.25).y, -1);
}

TEST(GridTest, CellOfHonorsOffsetAndRectangularCells) {
    GridDescriptor grid = MakeGrid(8, 4, 4, 2);
    
    EXPECT_EQ(CellOf(grid, 4.0, 2.0), (CellCoord{0, 0}));
    EXPECT_EQ(CellOf(grid, 3.9, 1.9), (CellCoord{-1, -1}));
    EXPECT_EQ(CellOf(grid, 20.0, 10.0), (CellCoord{2, 2}));
}

TEST(GridTest, CellOfIsMonotonicAndBracketsInput) {
    GridDescriptor grid = MakeGrid(3.5, 2.0, 1.25, -0.5);
    
    int previous = std::numeric_limits<int>::min();
    for (double x = -50.0; x <= 50.0; x += 0.37) {
        CellCoord cell = CellOf(grid, x, x);
        EXPECT_GE(cell.x, previous);
        previous = cell.x;
        
        CellBounds bounds = BoundsOf(grid, cell.x, cell.y);
        EXPECT_LE(bounds.topLeft.x, x + 1e-9);
        EXPECT_LT(x, bounds.bottomRight.x);
        EXPECT_LE(bounds.topLeft.y, x + 1e-9);
        EXPECT_LT(x, bounds.bottomRight.y);
    }
}

TEST(GridTest, BoundsOfReturnsCellCorners) {
    GridDescriptor grid = MakeGrid(32, 16, 10, 20);
    CellBounds bounds = BoundsOf(grid, 1, -1);
    
    EXPECT_DOUBLE_EQ(bounds.topLeft.x, 42.0);
    EXPECT_DOUBLE_EQ(bounds.topLeft.y, 4.0);
    EXPECT_DOUBLE_EQ(bounds.bottomRight.x, 74.0);
    EXPECT_DOUBLE_EQ(bounds.bottomRight.y, 20.0);
}

TEST(GridTest, CellRangeOfNormalizesCorners) {
    GridDescriptor grid = MakeGrid(32, 32);
    
    std::optional<CellRange> covered = CellRangeOf(grid, {63.0, 31.0}, 
                                                   {0.0, 0.0});
    ASSERT_TRUE(covered.has_value());
    CellRange range = *covered;
    EXPECT_EQ(range.minX, 0);
    EXPECT_EQ(range.maxX, 1);
    EXPECT_EQ(range.minY, 0);
    EXPECT_EQ(range.maxY, 0);
    EXPECT_EQ(range.Count(), 2);
    
    CellRange flipped = CellRangeOf(grid, {0.0, 31.0}, {63.0, 0.0}).value();
    EXPECT_EQ(flipped.minX, range.minX);
    EXPECT_EQ(flipped.maxX, range.maxX);
    EXPECT_EQ(flipped.minY, range.minY);
    EXPECT_EQ(flipped.maxY, range.maxY);
    
    EXPECT_TRUE(range.Contains({1, 0}));
    EXPECT_FALSE(range.Contains({2, 0}));
    EXPECT_FALSE(range.Contains({0, -1}));
}

TEST(GridTest, CellRangeOfRejectsUnaddressableCorners) {
    GridDescriptor grid = MakeGrid(8, 8);
    double inf = std::numeric_limits<double>::infinity();
    
    EXPECT_FALSE(CellRangeOf(grid, {0.0, 0.0}, {1e12, 8.0}).has_value());
    EXPECT_FALSE(CellRangeOf(grid, {-1e12, 0.0}, {0.0, 0.0}).has_value());
    EXPECT_FALSE(CellRangeOf(grid, {std::nan(""), 0.0}, {8.0, 8.0})
                     .has_value());
    EXPECT_FALSE(CellRangeOf(grid, {0.0, inf}, {8.0, 8.0}).has_value());
    
    // The last addressable cell is still reachable
    double edge = 8.0 * std::numeric_limits<int>::max();
    auto range = CellRangeOf(grid, {edge, 0.0}, {edge, 0.0});
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->maxX, std::numeric_limits<int>::max());
}

TEST(GridTest, CellOfClampsToIntRange) {
    GridDescriptor grid = MakeGrid(8, 8);
    
    EXPECT_EQ(CellOf(grid, 1e12, -1e12),
              (CellCoord{std::numeric_limits<int>::max(),
                         std::numeric_limits<int>::min()}));
    EXPECT_EQ(CellOf(grid, std::nan(""), 16.0), (CellCoord{0, 2}));
    
    EXPECT_TRUE(IsCellIndex(-5.0));
    EXPECT_FALSE(IsCellIndex(4e9));
    EXPECT_FALSE(IsCellIndex(std::nan("")));
}

TEST(GridTest, CellRangeCountDoesNotOverflow) {
    CellRange range;
    range.minX = -2000000000;
    range.maxX = 2000000000;
    range.minY = 0;
    range.maxY = 9;
    
    EXPECT_EQ(range.Width(), 4000000001LL);
    EXPECT_EQ(range.Count(), 40000000010LL);
}

TEST(GridTest, IsValidGridRejectsDegenerateGeometry) {
    EXPECT_TRUE(IsValidGrid(MakeGrid(8, 8)));
    EXPECT_TRUE(IsValidGrid(MakeGrid(0.5, 100, -3, 7)));
    
    EXPECT_FALSE(IsValidGrid(MakeGrid(0, 8)));
    EXPECT_FALSE(IsValidGrid(MakeGrid(8, -1)));
    EXPECT_FALSE(IsValidGrid(MakeGrid(std::nan(""), 8)));
    EXPECT_FALSE(IsValidGrid(
        MakeGrid(8, 8, std::numeric_limits<double>::infinity(), 0)));
}

TEST(GridTest, CellKeyRoundTripsNegativeCoordinates) {
    EXPECT_EQ(CellKey({-3, 7}), "-3:7");
    
    auto cell = ParseCellKey("-3:7");
    ASSERT_TRUE(cell.has_value());
    EXPECT_EQ(*cell, (CellCoord{-3, 7}));
    
    auto origin = ParseCellKey("0:-0");
    ASSERT_TRUE(origin.has_value());
    EXPECT_EQ(*origin, (CellCoord{0, 0}));
}

TEST(GridTest, ParseCellKeyRejectsMalformedKeys) {
    EXPECT_FALSE(ParseCellKey("").has_value());
    EXPECT_FALSE(ParseCellKey("1").has_value());
    EXPECT_FALSE(ParseCellKey("1:").has_value());
    EXPECT_FALSE(ParseCellKey(":1").has_value());
    EXPECT_FALSE(ParseCellKey("1:2:3").has_value());
    EXPECT_FALSE(ParseCellKey("a:1").has_value());
    EXPECT_FALSE(ParseCellKey(" 1:2").has_value());
    EXPECT_FALSE(ParseCellKey("1.5:2").has_value());
    EXPECT_FALSE(ParseCellKey("-:2").has_value());
    EXPECT_FALSE(ParseCellKey("99999999999:1").has_value());
}
