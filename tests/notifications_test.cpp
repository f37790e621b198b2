#include "test_helpers.h"
#include <stdexcept>

using namespace GridPlanner;
using GridPlanner::Testing::PlannerTest;
using GridPlanner::Testing::RecordingListener;

namespace {

class ThrowingListener : public IChangeListener {
public:
    void OnCellsChanged(const CellsChangedEvent&) override {
        ++calls;
        throw std::runtime_error("renderer exploded");
    }
    
    void OnRegionsChanged(WorkspaceId, const RegionChangeEvent&) override {
        ++calls;
        throw std::runtime_error("panel exploded");
    }
    
    int calls = 0;
};

// Throws something that is not a std::exception
class IntThrowingListener : public IChangeListener {
public:
    void OnCellsChanged(const CellsChangedEvent&) override {
        ++calls;
        throw 42;
    }
    
    void OnRegionsChanged(WorkspaceId, const RegionChangeEvent&) override {
        ++calls;
        throw 7;
    }
    
    int calls = 0;
};

// Rebuilds itself on every grid change, which notifies again
class ReentrantListener : public IChangeListener {
public:
    explicit ReentrantListener(ChangeDispatcher& events) : m_events(events) {}
    
    void OnGridChanged(WorkspaceId workspace, SurfaceId surface) override {
        ++calls;
        m_events.NotifyGridChanged(workspace, surface);
    }
    
    int calls = 0;
    
private:
    ChangeDispatcher& m_events;
};

// Unregisters itself and a second listener on first notification
class RemovingListener : public IChangeListener {
public:
    RemovingListener(ChangeDispatcher& events, IChangeListener* other)
        : m_events(events), m_other(other) {}
    
    void OnUserChanged(UserId, UserChangeKind) override {
        ++calls;
        m_events.RemoveListener(this);
        m_events.RemoveListener(m_other);
    }
    
    int calls = 0;
    
private:
    ChangeDispatcher& m_events;
    IChangeListener* m_other;
};

} // namespace

TEST(ChangeDispatcherTest, DeliversToEveryListenerOnce) {
    ChangeDispatcher events;
    RecordingListener a;
    RecordingListener b;
    events.AddListener(&a);
    events.AddListener(&b);
    events.AddListener(&a);
    events.AddListener(nullptr);
    EXPECT_EQ(events.GetListenerCount(), 2u);
    
    events.NotifyGridChanged(3, 4);
    EXPECT_EQ(a.grids.size(), 1u);
    EXPECT_EQ(b.grids.size(), 1u);
    EXPECT_EQ(a.grids[0], std::make_pair(WorkspaceId(3), SurfaceId(4)));
    
    events.RemoveListener(&a);
    events.NotifyUserChanged(1, UserChangeKind::Tool);
    EXPECT_TRUE(a.users.empty());
    EXPECT_EQ(b.users.size(), 1u);
}

TEST(ChangeDispatcherTest, ThrowingListenerDoesNotStopOthers) {
    ChangeDispatcher events;
    ThrowingListener thrower;
    RecordingListener recorder;
    events.AddListener(&thrower);
    events.AddListener(&recorder);
    
    EXPECT_NO_THROW(events.NotifyCellsChanged(1, 1, std::nullopt, 
                                              std::nullopt));
    EXPECT_EQ(thrower.calls, 1);
    ASSERT_EQ(recorder.cells.size(), 1u);
    EXPECT_TRUE(recorder.cells[0].IsFullRefresh());
    
    // A failed listener keeps receiving later notifications
    events.NotifyCellsChanged(1, 1, std::nullopt, std::nullopt);
    EXPECT_EQ(thrower.calls, 2);
}

TEST(ChangeDispatcherTest, NonStandardThrowIsContained) {
    ChangeDispatcher events;
    IntThrowingListener thrower;
    RecordingListener recorder;
    events.AddListener(&thrower);
    events.AddListener(&recorder);
    
    EXPECT_NO_THROW(events.NotifyCellsChanged(1, 1, std::nullopt, 
                                              std::nullopt));
    EXPECT_EQ(recorder.cells.size(), 1u);
    
    // Still reachable afterwards, so it was not left marked busy
    events.NotifyCellsChanged(1, 1, std::nullopt, std::nullopt);
    EXPECT_EQ(thrower.calls, 2);
    EXPECT_EQ(recorder.cells.size(), 2u);
    EXPECT_EQ(events.GetDroppedCount(), 0u);
}

TEST_F(PlannerTest, NonStandardThrowDoesNotCutDeleteShort) {
    IntThrowingListener thrower;
    events.AddListener(&thrower);
    ASSERT_TRUE(planner.SetSelectedRegion(WS, USER, 2u).Applied());
    ASSERT_TRUE(FillCells(2, 0, 0, 1, 0).Applied());
    
    ActionResult del = planner.DeleteRegion(WS, USER, 2, 3u);
    EXPECT_TRUE(del.Applied());
    EXPECT_EQ(planner.GetSelectedRegion(USER), 3u);
    EXPECT_EQ(planner.CellAt(WS, SURFACE, 1, 0), 3u);
    
    events.RemoveListener(&thrower);
}

TEST(ChangeDispatcherTest, NestedNotificationToSameListenerIsDropped) {
    ChangeDispatcher events;
    ReentrantListener reentrant(events);
    RecordingListener recorder;
    events.AddListener(&reentrant);
    events.AddListener(&recorder);
    
    events.NotifyGridChanged(1, 2);
    
    EXPECT_EQ(reentrant.calls, 1);
    EXPECT_EQ(events.GetDroppedCount(), 1u);
    // The other listener sees both the nested and the outer notification
    EXPECT_EQ(recorder.grids.size(), 2u);
}

TEST(ChangeDispatcherTest, ListenersMayUnregisterDuringDispatch) {
    ChangeDispatcher events;
    RecordingListener later;
    RemovingListener remover(events, &later);
    events.AddListener(&remover);
    events.AddListener(&later);
    
    events.NotifyUserChanged(1, UserChangeKind::Selection);
    EXPECT_EQ(remover.calls, 1);
    EXPECT_TRUE(later.users.empty());
    EXPECT_EQ(events.GetListenerCount(), 0u);
    
    events.NotifyUserChanged(1, UserChangeKind::Selection);
    EXPECT_EQ(remover.calls, 1);
}

TEST(ChangeDispatcherTest, RegionChangeTypeNames) {
    EXPECT_STREQ(RegionChangeTypeName(RegionChangeType::Added), 
                 "region-added");
    EXPECT_STREQ(RegionChangeTypeName(RegionChangeType::Deleted), 
                 "region-deleted");
    EXPECT_STREQ(RegionChangeTypeName(RegionChangeType::Modified), 
                 "region-modified");
    EXPECT_STREQ(RegionChangeTypeName(RegionChangeType::NameModified),
                 "region-name-modified");
    EXPECT_STREQ(RegionChangeTypeName(RegionChangeType::OrderChanged),
                 "region-order-changed");
}

TEST_F(PlannerTest, ListenerFailureDoesNotAbortMutation) {
    ThrowingListener thrower;
    events.AddListener(&thrower);
    
    ActionResult fill = FillCells(1, 0, 0, 1, 1);
    EXPECT_TRUE(fill.Applied());
    EXPECT_EQ(Image().Size(), 4u);
    EXPECT_EQ(listener.cells.size(), 1u);
    
    ActionResult del = planner.DeleteRegion(WS, USER, 1, std::nullopt);
    EXPECT_TRUE(del.Applied());
    EXPECT_TRUE(Image().Empty());
    EXPECT_TRUE(planner.CanUndo(USER));
    
    events.RemoveListener(&thrower);
}

TEST_F(PlannerTest, RegionEventsCarrySnapshots) {
    listener.Clear();
    ActionResult add = planner.AddRegion(WS, USER, "Docks", Color(0, 0, 1));
    
    ASSERT_EQ(listener.regions.size(), 1u);
    const RegionChangeEvent& added = listener.regions[0].event;
    EXPECT_EQ(listener.regions[0].workspace, WS);
    EXPECT_EQ(added.type, RegionChangeType::Added);
    EXPECT_EQ(added.regionId, add.regionId);
    EXPECT_EQ(added.regionName, "Docks");
    EXPECT_FALSE(added.before.has_value());
    ASSERT_TRUE(added.after.has_value());
    EXPECT_EQ(added.after->order, 11);
    
    listener.Clear();
    planner.Undo(USER);
    ASSERT_EQ(listener.regions.size(), 1u);
    EXPECT_EQ(listener.regions[0].event.type, RegionChangeType::Deleted);
    EXPECT_TRUE(listener.regions[0].event.before.has_value());
}
