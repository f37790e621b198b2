#include "Notifications.h"
#include <SDL3/SDL.h>
#include <algorithm>
#include <exception>

namespace GridPlanner {

const char* RegionChangeTypeName(RegionChangeType type) {
    switch (type) {
        case RegionChangeType::Added: return "region-added";
        case RegionChangeType::Deleted: return "region-deleted";
        case RegionChangeType::Modified: return "region-modified";
        case RegionChangeType::NameModified: return "region-name-modified";
        case RegionChangeType::OrderChanged: return "region-order-changed";
    }
    return "region-modified";
}

void ChangeDispatcher::AddListener(IChangeListener* listener) {
    if (!listener || FindEntry(listener)) {
        return;
    }
    m_listeners.push_back({listener, false});
}

void ChangeDispatcher::RemoveListener(IChangeListener* listener) {
    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
            [listener](const Entry& e) { return e.listener == listener; }),
        m_listeners.end());
}

ChangeDispatcher::Entry* ChangeDispatcher::FindEntry(
    IChangeListener* listener
) {
    auto it = std::find_if(m_listeners.begin(), m_listeners.end(),
        [listener](const Entry& e) { return e.listener == listener; });
    return it != m_listeners.end() ? &(*it) : nullptr;
}

ChangeDispatcher::BusyScope::BusyScope(ChangeDispatcher& owner,
                                       IChangeListener* listener)
    : m_owner(owner), m_listener(listener) {
    if (Entry* entry = m_owner.FindEntry(m_listener)) {
        entry->dispatching = true;
    }
}

ChangeDispatcher::BusyScope::~BusyScope() {
    // The listener may have removed itself
    if (Entry* entry = m_owner.FindEntry(m_listener)) {
        entry->dispatching = false;
    }
}

template <typename Fn>
void ChangeDispatcher::Dispatch(const char* what, Fn&& fn) {
    // Listeners may add or remove listeners while being notified
    std::vector<IChangeListener*> targets;
    targets.reserve(m_listeners.size());
    for (const auto& entry : m_listeners) {
        targets.push_back(entry.listener);
    }
    
    for (IChangeListener* listener : targets) {
        Entry* entry = FindEntry(listener);
        if (!entry) {
            continue;  // Removed by an earlier listener
        }
        if (entry->dispatching) {
            ++m_droppedCount;
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                         "Dropped re-entrant %s notification", what);
            continue;
        }
        
        BusyScope busy(*this, listener);
        try {
            fn(*listener);
        } catch (const std::exception& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "Listener failed handling %s: %s", what, e.what());
        } catch (...) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "Listener failed handling %s: unknown exception",
                         what);
        }
    }
}

void ChangeDispatcher::NotifyCellsChanged(
    WorkspaceId workspace, SurfaceId surface,
    std::optional<std::vector<CellCoord>> changedCells,
    std::optional<RegionId> newRegionId
) {
    CellsChangedEvent event;
    event.workspace = workspace;
    event.surface = surface;
    event.changedCells = std::move(changedCells);
    event.newRegionId = newRegionId;
    
    Dispatch("cells-changed", [&event](IChangeListener& listener) {
        listener.OnCellsChanged(event);
    });
}

void ChangeDispatcher::NotifyRegionsChanged(WorkspaceId workspace,
                                            const RegionChangeEvent& event) {
    Dispatch(RegionChangeTypeName(event.type),
        [workspace, &event](IChangeListener& listener) {
            listener.OnRegionsChanged(workspace, event);
        });
}

void ChangeDispatcher::NotifyGridChanged(WorkspaceId workspace,
                                         SurfaceId surface) {
    Dispatch("grid-changed", [workspace, surface](IChangeListener& listener) {
        listener.OnGridChanged(workspace, surface);
    });
}

void ChangeDispatcher::NotifyUserChanged(UserId user, UserChangeKind kind) {
    Dispatch("user-changed", [user, kind](IChangeListener& listener) {
        listener.OnUserChanged(user, kind);
    });
}

} // namespace GridPlanner
