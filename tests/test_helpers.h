#pragma once

#include "Notifications.h"
#include "Planner.h"
#include "Store.h"
#include <gtest/gtest.h>
#include <vector>

namespace GridPlanner {
namespace Testing {

// Records every notification it receives
class RecordingListener : public IChangeListener {
public:
    struct RegionsEntry {
        WorkspaceId workspace;
        RegionChangeEvent event;
    };
    
    struct UserEntry {
        UserId user;
        UserChangeKind kind;
    };
    
    void OnCellsChanged(const CellsChangedEvent& event) override {
        cells.push_back(event);
    }
    
    void OnRegionsChanged(WorkspaceId workspace,
                          const RegionChangeEvent& event) override {
        regions.push_back({workspace, event});
    }
    
    void OnGridChanged(WorkspaceId workspace, SurfaceId surface) override {
        grids.emplace_back(workspace, surface);
    }
    
    void OnUserChanged(UserId user, UserChangeKind kind) override {
        users.push_back({user, kind});
    }
    
    void Clear() {
        cells.clear();
        regions.clear();
        grids.clear();
        users.clear();
    }
    
    size_t CountUser(UserId user, UserChangeKind kind) const {
        size_t n = 0;
        for (const auto& entry : users) {
            if (entry.user == user && entry.kind == kind) ++n;
        }
        return n;
    }
    
    std::vector<CellsChangedEvent> cells;
    std::vector<RegionsEntry> regions;
    std::vector<std::pair<WorkspaceId, SurfaceId>> grids;
    std::vector<UserEntry> users;
};

// Store + dispatcher + planner wired together, with a recording listener
class PlannerTest : public ::testing::Test {
protected:
    static constexpr WorkspaceId WS = 1;
    static constexpr UserId USER = 1;
    static constexpr SurfaceId SURFACE = 1;
    
    void SetUp() override {
        events.AddListener(&listener);
    }
    
    void TearDown() override {
        events.RemoveListener(&listener);
    }
    
    // Fill cells [x0..x1] x [y0..y1] on the default 8x8 grid
    ActionResult FillCells(std::optional<RegionId> region,
                           int x0, int y0, int x1, int y1,
                           UserId user = USER, WorkspaceId ws = WS) {
        return planner.FillRectangle(ws, user, SURFACE, region,
            {x0 * 8.0 + 1.0, y0 * 8.0 + 1.0},
            {x1 * 8.0 + 1.0, y1 * 8.0 + 1.0});
    }
    
    CellMap Image(WorkspaceId ws = WS) {
        return store.EnsureWorkspace(ws).GetImage(SURFACE);
    }
    
    Store store;
    ChangeDispatcher events;
    Planner planner{store, events};
    RecordingListener listener;
};

} // namespace Testing
} // namespace GridPlanner
