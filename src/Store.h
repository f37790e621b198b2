#pragma once

#include "Types.h"
#include "Model.h"
#include "UserState.h"
#include "Config.h"
#include <map>
#include <vector>

namespace GridPlanner {

/**
 * Root of all engine state: every workspace Model and every UserState.
 * Constructed explicitly and passed by reference; there is no global
 * instance. Workspaces and users are created lazily on first access.
 */
class Store {
public:
    using WorkspaceMap = std::map<WorkspaceId, Model>;
    using UserMap = std::map<UserId, UserState>;
    
    explicit Store(const PlannerConfig& config = PlannerConfig());
    
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&) = default;
    Store& operator=(Store&&) = default;
    
    // ========================================================================
    // Workspaces
    // ========================================================================
    
    /**
     * Get a workspace, creating and seeding it with the default regions
     * on first access.
     */
    Model& EnsureWorkspace(WorkspaceId id);
    
    Model* FindWorkspace(WorkspaceId id);
    const Model* FindWorkspace(WorkspaceId id) const;
    
    const WorkspaceMap& GetWorkspaces() const { return m_workspaces; }
    
    /**
     * Insert a fully built workspace, replacing any existing one
     * (snapshot loading).
     */
    void PutWorkspace(Model model);
    
    // ========================================================================
    // Users
    // ========================================================================
    
    /**
     * Get a user, creating one with default state on first access.
     */
    UserState& EnsureUser(UserId id);
    
    UserState* FindUser(UserId id);
    const UserState* FindUser(UserId id) const;
    
    /**
     * Record that a user is acting in a workspace.
     */
    UserState& AttachUser(UserId user, WorkspaceId workspace);
    
    std::vector<UserState*> UsersInWorkspace(WorkspaceId workspace);
    
    UserMap& GetUsers() { return m_users; }
    const UserMap& GetUsers() const { return m_users; }
    
    // ========================================================================
    // Administrative resets (irreversible, bypass history)
    // ========================================================================
    
    /**
     * Drop a workspace and every history entry of any user that refers to
     * it. Users attached to it keep their session but lose the selection.
     * @return true if the workspace existed
     */
    bool ResetWorkspace(WorkspaceId id);
    
    /**
     * Clear the cell map of one surface. The grid is kept.
     * @return true if the surface had a cell map
     */
    bool ResetSurface(WorkspaceId id, SurfaceId surface);
    
    /**
     * Drop a user's state entirely (selection, tool, history).
     * @return true if the user existed
     */
    bool ResetUser(UserId id);
    
    /**
     * Drop everything.
     */
    void ResetAll();
    
    // ========================================================================
    // Settings
    // ========================================================================
    
    const PlannerConfig& GetConfig() const { return m_config; }
    
    size_t GetUndoCapacity() const { return m_undoCapacity; }
    
    /**
     * Change the undo bound for existing and future users.
     */
    void SetUndoCapacity(size_t capacity);
    
    // True if any workspace changed since the last ClearDirty
    bool IsDirty() const;
    void ClearDirty();
    
private:
    PlannerConfig m_config;
    size_t m_undoCapacity;
    WorkspaceMap m_workspaces;
    UserMap m_users;
};

} // namespace GridPlanner
