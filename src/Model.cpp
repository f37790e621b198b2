#include "Model.h"

namespace GridPlanner {

Model::Model(WorkspaceId id, const GridDescriptor& defaultGrid)
    : id(id)
    , defaultGrid(defaultGrid)
{}

void Model::MarkDirty() {
    dirty = true;
}

void Model::ClearDirty() {
    dirty = false;
}

GridDescriptor Model::GetGrid(SurfaceId surface) const {
    auto it = grids.find(surface);
    if (it != grids.end()) {
        return it->second;
    }
    return defaultGrid;
}

void Model::SetGrid(SurfaceId surface, const GridDescriptor& grid) {
    grids[surface] = grid;
    MarkDirty();
}

CellMap& Model::GetImage(SurfaceId surface) {
    return images[surface];
}

const CellMap* Model::FindImage(SurfaceId surface) const {
    auto it = images.find(surface);
    return it != images.end() ? &it->second : nullptr;
}

RegionId Model::GetCell(SurfaceId surface, const CellCoord& cell) const {
    const CellMap* image = FindImage(surface);
    return image ? image->Get(cell) : EMPTY_REGION_ID;
}

void Model::ResetSurface(SurfaceId surface) {
    images[surface].Clear();
    MarkDirty();
}

SurfaceCells Model::FindCellsWithRegion(RegionId regionId) const {
    SurfaceCells result;
    for (const auto& [surface, image] : images) {
        std::vector<CellCoord> cells = image.CellsWithRegion(regionId);
        if (!cells.empty()) {
            result[surface] = std::move(cells);
        }
    }
    return result;
}

void Model::SeedRegions(
    const std::vector<std::pair<std::string, Color>>& defs
) {
    for (const auto& [name, color] : defs) {
        regions.Add(name, color);
    }
}

} // namespace GridPlanner
