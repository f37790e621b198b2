#pragma once

#include "Types.h"
#include "Grid.h"
#include "RegionStore.h"
#include <optional>
#include <string>
#include <vector>

namespace GridPlanner {

// ============================================================================
// Change events
// ============================================================================

enum class RegionChangeType {
    Added,          // Region was added (or restored by undo)
    Deleted,        // Region was deleted (or an add was undone)
    Modified,       // Color changed, name may have changed too
    NameModified,   // Only the name changed; no recoloring needed
    OrderChanged    // Only the order changed; nothing to redraw
};

const char* RegionChangeTypeName(RegionChangeType type);

struct RegionChangeEvent {
    RegionChangeType type = RegionChangeType::Modified;
    RegionId regionId = EMPTY_REGION_ID;
    std::string regionName;
    std::optional<Region> before;
    std::optional<Region> after;
};

/**
 * Cells of one surface changed. Without a cell list the consumer must do a
 * full refresh of the surface. newRegionId is set when every listed cell
 * now holds that region (EMPTY_REGION_ID for an erase).
 */
struct CellsChangedEvent {
    WorkspaceId workspace = 0;
    SurfaceId surface = 0;
    std::optional<std::vector<CellCoord>> changedCells;
    std::optional<RegionId> newRegionId;
    
    bool IsFullRefresh() const { return !changedCells.has_value(); }
};

enum class UserChangeKind {
    Visibility,     // Boundary visibility level
    Selection,      // Selected region
    Tool,           // Selected tool
    History         // Undo/redo availability or descriptions
};

// ============================================================================
// Listener interface
// ============================================================================

/**
 * Consumer of backend changes (renderer, UI). All methods default to no-op
 * so a consumer only overrides what it draws.
 */
class IChangeListener {
public:
    virtual ~IChangeListener() = default;
    
    virtual void OnCellsChanged(const CellsChangedEvent& event) {}
    
    virtual void OnRegionsChanged(WorkspaceId workspace,
                                  const RegionChangeEvent& event) {}
    
    virtual void OnGridChanged(WorkspaceId workspace, SurfaceId surface) {}
    
    virtual void OnUserChanged(UserId user, UserChangeKind kind) {}
};

// ============================================================================
// Dispatcher
// ============================================================================

/**
 * Fans change notifications out to registered listeners.
 *
 * Each listener call is isolated: an exception escaping a listener is
 * logged and the remaining listeners still run. A notification that would
 * reach a listener while that same listener is already handling one is
 * dropped; the outer call is expected to pick up the final state.
 *
 * Listeners are not owned and must be removed before they are destroyed.
 */
class ChangeDispatcher {
public:
    void AddListener(IChangeListener* listener);
    void RemoveListener(IChangeListener* listener);
    size_t GetListenerCount() const { return m_listeners.size(); }
    
    void NotifyCellsChanged(WorkspaceId workspace, SurfaceId surface,
                            std::optional<std::vector<CellCoord>> changedCells,
                            std::optional<RegionId> newRegionId);
    
    void NotifyRegionsChanged(WorkspaceId workspace,
                              const RegionChangeEvent& event);
    
    void NotifyGridChanged(WorkspaceId workspace, SurfaceId surface);
    
    void NotifyUserChanged(UserId user, UserChangeKind kind);
    
    /**
     * Number of notifications dropped because of re-entrancy.
     */
    size_t GetDroppedCount() const { return m_droppedCount; }
    
private:
    struct Entry {
        IChangeListener* listener;
        bool dispatching;
    };
    
    // Marks a listener busy for one call, however that call exits
    class BusyScope {
    public:
        BusyScope(ChangeDispatcher& owner, IChangeListener* listener);
        ~BusyScope();
        
        BusyScope(const BusyScope&) = delete;
        BusyScope& operator=(const BusyScope&) = delete;
        
    private:
        ChangeDispatcher& m_owner;
        IChangeListener* m_listener;
    };
    
    template <typename Fn>
    void Dispatch(const char* what, Fn&& fn);
    
    Entry* FindEntry(IChangeListener* listener);
    
    std::vector<Entry> m_listeners;
    size_t m_droppedCount = 0;
};

} // namespace GridPlanner
