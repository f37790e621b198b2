#include "Grid.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cerrno>
#include <climits>

namespace GridPlanner {

bool IsCellIndex(double index) {
    return std::isfinite(index) &&
           index >= static_cast<double>(INT_MIN) &&
           index <= static_cast<double>(INT_MAX);
}

// Floor a world offset to a cell index, clamped to the int range
static int ClampedIndex(double offset, double size) {
    double index = std::floor(offset / size);
    if (std::isnan(index)) {
        return 0;
    }
    index = std::clamp(index, static_cast<double>(INT_MIN),
                       static_cast<double>(INT_MAX));
    return static_cast<int>(index);
}

CellCoord CellOf(const GridDescriptor& grid, double worldX, double worldY) {
    CellCoord cell;
    cell.x = ClampedIndex(worldX - grid.xOffset, grid.width);
    cell.y = ClampedIndex(worldY - grid.yOffset, grid.height);
    return cell;
}

CellBounds BoundsOf(const GridDescriptor& grid, int cellX, int cellY) {
    CellBounds bounds;
    bounds.topLeft.x = cellX * grid.width + grid.xOffset;
    bounds.topLeft.y = cellY * grid.height + grid.yOffset;
    bounds.bottomRight.x = bounds.topLeft.x + grid.width;
    bounds.bottomRight.y = bounds.topLeft.y + grid.height;
    return bounds;
}

std::optional<CellRange> CellRangeOf(const GridDescriptor& grid,
                                     const WorldPoint& a, 
                                     const WorldPoint& b) {
    for (const WorldPoint* p : {&a, &b}) {
        if (!IsCellIndex(std::floor((p->x - grid.xOffset) / grid.width)) ||
            !IsCellIndex(std::floor((p->y - grid.yOffset) / grid.height))) {
            return std::nullopt;
        }
    }
    
    CellCoord ca = CellOf(grid, a.x, a.y);
    CellCoord cb = CellOf(grid, b.x, b.y);
    
    CellRange range;
    range.minX = std::min(ca.x, cb.x);
    range.maxX = std::max(ca.x, cb.x);
    range.minY = std::min(ca.y, cb.y);
    range.maxY = std::max(ca.y, cb.y);
    return range;
}

bool IsValidGrid(const GridDescriptor& grid) {
    return std::isfinite(grid.width) && std::isfinite(grid.height) &&
           std::isfinite(grid.xOffset) && std::isfinite(grid.yOffset) &&
           grid.width > 0.0 && grid.height > 0.0;
}

std::string CellKey(const CellCoord& cell) {
    return std::to_string(cell.x) + ":" + std::to_string(cell.y);
}

// Parse one signed decimal integer occupying exactly [begin, end)
static std::optional<int> ParseCoordinate(const std::string& text,
                                          size_t begin, size_t end) {
    if (begin >= end) {
        return std::nullopt;
    }
    size_t digits = begin;
    if (text[digits] == '-') {
        ++digits;
    }
    if (digits >= end) {
        return std::nullopt;
    }
    for (size_t i = digits; i < end; ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return std::nullopt;
        }
    }
    
    std::string part = text.substr(begin, end - begin);
    errno = 0;
    long value = std::strtol(part.c_str(), nullptr, 10);
    if (errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<CellCoord> ParseCellKey(const std::string& key) {
    size_t sep = key.find(':');
    if (sep == std::string::npos || key.find(':', sep + 1) != std::string::npos) {
        return std::nullopt;
    }
    
    auto x = ParseCoordinate(key, 0, sep);
    auto y = ParseCoordinate(key, sep + 1, key.size());
    if (!x || !y) {
        return std::nullopt;
    }
    return CellCoord{*x, *y};
}

} // namespace GridPlanner
