#include "Store.h"
#include <SDL3/SDL.h>
#include <algorithm>

namespace GridPlanner {

Store::Store(const PlannerConfig& config)
    : m_config(config)
    , m_undoCapacity(std::clamp<size_t>(config.undoCapacity, 1,
                                        Limits::MAX_UNDO_CAPACITY))
{}

Model& Store::EnsureWorkspace(WorkspaceId id) {
    auto it = m_workspaces.find(id);
    if (it != m_workspaces.end()) {
        return it->second;
    }
    
    Model model(id, m_config.defaultGrid);
    model.SeedRegions(m_config.RegionSeeds());
    auto result = m_workspaces.emplace(id, std::move(model));
    
    SDL_Log("Created workspace %u with %zu default regions", id,
            result.first->second.regions.NonEmptyCount());
    return result.first->second;
}

Model* Store::FindWorkspace(WorkspaceId id) {
    auto it = m_workspaces.find(id);
    return it != m_workspaces.end() ? &it->second : nullptr;
}

const Model* Store::FindWorkspace(WorkspaceId id) const {
    auto it = m_workspaces.find(id);
    return it != m_workspaces.end() ? &it->second : nullptr;
}

void Store::PutWorkspace(Model model) {
    WorkspaceId id = model.id;
    m_workspaces.erase(id);
    m_workspaces.emplace(id, std::move(model));
}

UserState& Store::EnsureUser(UserId id) {
    auto it = m_users.find(id);
    if (it != m_users.end()) {
        return it->second;
    }
    auto result = m_users.emplace(
        id, UserState(id, m_config.defaultVisibility, m_undoCapacity));
    return result.first->second;
}

UserState* Store::FindUser(UserId id) {
    auto it = m_users.find(id);
    return it != m_users.end() ? &it->second : nullptr;
}

const UserState* Store::FindUser(UserId id) const {
    auto it = m_users.find(id);
    return it != m_users.end() ? &it->second : nullptr;
}

UserState& Store::AttachUser(UserId user, WorkspaceId workspace) {
    UserState& state = EnsureUser(user);
    if (state.workspace != workspace) {
        // Selection belongs to the previous workspace's region list
        state.workspace = workspace;
        state.selectedRegionId = EMPTY_REGION_ID;
    }
    return state;
}

std::vector<UserState*> Store::UsersInWorkspace(WorkspaceId workspace) {
    std::vector<UserState*> result;
    for (auto& [id, user] : m_users) {
        if (user.workspace == workspace) {
            result.push_back(&user);
        }
    }
    return result;
}

bool Store::ResetWorkspace(WorkspaceId id) {
    bool existed = m_workspaces.erase(id) > 0;
    
    size_t purged = 0;
    for (auto& [userId, user] : m_users) {
        purged += user.history.RemoveIf([id](const ICommand& cmd) {
            return cmd.GetWorkspace() == id;
        });
        if (user.workspace == id) {
            user.selectedRegionId = EMPTY_REGION_ID;
        }
    }
    
    SDL_Log("Reset workspace %u (%zu history entries discarded)", id, purged);
    return existed;
}

bool Store::ResetSurface(WorkspaceId id, SurfaceId surface) {
    Model* model = FindWorkspace(id);
    if (!model || !model->FindImage(surface)) {
        return false;
    }
    model->ResetSurface(surface);
    return true;
}

bool Store::ResetUser(UserId id) {
    return m_users.erase(id) > 0;
}

void Store::ResetAll() {
    m_workspaces.clear();
    m_users.clear();
    SDL_Log("Reset all workspaces and users");
}

void Store::SetUndoCapacity(size_t capacity) {
    m_undoCapacity = std::clamp<size_t>(capacity, 1,
                                        Limits::MAX_UNDO_CAPACITY);
    for (auto& [id, user] : m_users) {
        user.history.SetCapacity(m_undoCapacity);
    }
}

bool Store::IsDirty() const {
    for (const auto& [id, model] : m_workspaces) {
        if (model.dirty) {
            return true;
        }
    }
    return false;
}

void Store::ClearDirty() {
    for (auto& [id, model] : m_workspaces) {
        model.ClearDirty();
    }
}

} // namespace GridPlanner
