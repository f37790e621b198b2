#pragma once

#include <string>
#include <optional>
#include <functional>
#include <cstdint>

namespace GridPlanner {

// ============================================================================
// Grid configuration
// ============================================================================

/**
 * Geometry of the overlay grid on one surface, in world-space units.
 * Cell (0, 0) has its top-left corner at (xOffset, yOffset).
 */
struct GridDescriptor {
    double width = 8.0;
    double height = 8.0;
    double xOffset = 0.0;
    double yOffset = 0.0;
    
    bool operator==(const GridDescriptor& other) const {
        return width == other.width && height == other.height &&
               xOffset == other.xOffset && yOffset == other.yOffset;
    }
    
    bool operator!=(const GridDescriptor& other) const {
        return !(*this == other);
    }
};

struct WorldPoint {
    double x = 0.0;
    double y = 0.0;
};

// ============================================================================
// Cells
// ============================================================================

struct CellCoord {
    int x = 0;
    int y = 0;
    
    bool operator==(const CellCoord& other) const {
        return x == other.x && y == other.y;
    }
    
    bool operator!=(const CellCoord& other) const {
        return !(*this == other);
    }
    
    // Row-major, used for stable output ordering
    bool operator<(const CellCoord& other) const {
        return y != other.y ? y < other.y : x < other.x;
    }
};

// Hash function for CellCoord
struct CellCoordHash {
    std::size_t operator()(const CellCoord& c) const {
        return std::hash<int>()(c.x) ^ (std::hash<int>()(c.y) << 1);
    }
};

// World-space corners of a cell
struct CellBounds {
    WorldPoint topLeft;
    WorldPoint bottomRight;
};

// Inclusive range of cells
struct CellRange {
    int minX = 0;
    int minY = 0;
    int maxX = 0;
    int maxY = 0;
    
    long long Width() const { return static_cast<long long>(maxX) - minX + 1; }
    long long Height() const { return static_cast<long long>(maxY) - minY + 1; }
    long long Count() const { return Width() * Height(); }
    
    bool Contains(const CellCoord& c) const {
        return c.x >= minX && c.x <= maxX && c.y >= minY && c.y <= maxY;
    }
};

// Pulled off a footprint's far edge before flooring so a cell whose edge
// lies exactly on a new grid line does not spill into the next cell.
constexpr double REPROJECT_EPSILON = 0.0001;

// ============================================================================
// Geometry
// ============================================================================

/**
 * True if a floored cell index is finite and fits in an int.
 */
bool IsCellIndex(double index);

/**
 * Cell containing a world position. Uses floor division so negative
 * coordinates map to negative cells (-1.0 at size 32 is cell -1).
 * Indices beyond the int range are clamped to it; NaN maps to 0.
 */
CellCoord CellOf(const GridDescriptor& grid, double worldX, double worldY);

/**
 * World-space corners of a cell.
 */
CellBounds BoundsOf(const GridDescriptor& grid, int cellX, int cellY);

/**
 * Inclusive cell range covered by a world rectangle.
 * Corners may be given in any order.
 * @return nullopt if a corner is not finite or its cell index does not
 *         fit in an int
 */
std::optional<CellRange> CellRangeOf(const GridDescriptor& grid,
                                     const WorldPoint& a, 
                                     const WorldPoint& b);

/**
 * Width and height strictly positive and every field finite.
 */
bool IsValidGrid(const GridDescriptor& grid);

// ============================================================================
// Cell keys ("x:y"), the persisted form of a cell coordinate
// ============================================================================

std::string CellKey(const CellCoord& cell);
std::optional<CellCoord> ParseCellKey(const std::string& key);

} // namespace GridPlanner
