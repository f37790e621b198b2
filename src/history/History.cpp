#include "History.h"
#include <SDL3/SDL.h>
#include <algorithm>

namespace GridPlanner {

History::History(size_t capacity)
    : m_capacity(std::max<size_t>(capacity, 1))
{}

bool History::AddCommand(CommandPtr cmd, Store& store, 
                         ChangeDispatcher& events, bool execute) {
    if (!cmd) {
        return false;
    }
    
    // Execute the command if requested
    if (execute && !cmd->Execute(store, events)) {
        return false;
    }
    
    // Add to undo stack
    m_undoStack.push_back(std::move(cmd));
    
    // Clear redo stack (no branching)
    m_redoStack.clear();
    
    TrimToCapacity();
    return true;
}

bool History::Undo(Store& store, ChangeDispatcher& events) {
    while (CanUndo()) {
        auto cmd = std::move(m_undoStack.back());
        m_undoStack.pop_back();
        
        if (!cmd) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Discarding null undo entry");
            continue;
        }
        
        cmd->Undo(store, events);
        m_redoStack.push_back(std::move(cmd));
        return true;
    }
    return false;
}

bool History::Redo(Store& store, ChangeDispatcher& events) {
    while (CanRedo()) {
        auto cmd = std::move(m_redoStack.back());
        m_redoStack.pop_back();
        
        if (!cmd) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Discarding null redo entry");
            continue;
        }
        
        if (!cmd->Execute(store, events)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Discarding redo entry '%s': workspace %u is gone",
                        cmd->GetDescription().c_str(), cmd->GetWorkspace());
            return false;
        }
        
        m_undoStack.push_back(std::move(cmd));
        TrimToCapacity();
        return true;
    }
    return false;
}

void History::Clear() {
    m_undoStack.clear();
    m_redoStack.clear();
}

size_t History::RemoveIf(
    const std::function<bool(const ICommand&)>& predicate
) {
    size_t removed = 0;
    auto prune = [&](Stack& stack) {
        auto it = std::remove_if(stack.begin(), stack.end(),
            [&](const CommandPtr& cmd) {
                return !cmd || predicate(*cmd);
            });
        removed += static_cast<size_t>(std::distance(it, stack.end()));
        stack.erase(it, stack.end());
    };
    prune(m_undoStack);
    prune(m_redoStack);
    return removed;
}

bool History::CanUndo() const {
    return !m_undoStack.empty();
}

bool History::CanRedo() const {
    return !m_redoStack.empty();
}

std::string History::GetUndoDescription() const {
    if (m_undoStack.empty() || !m_undoStack.back()) {
        return "";
    }
    return m_undoStack.back()->GetDescription();
}

std::string History::GetRedoDescription() const {
    if (m_redoStack.empty() || !m_redoStack.back()) {
        return "";
    }
    return m_redoStack.back()->GetDescription();
}

void History::SetCapacity(size_t capacity) {
    m_capacity = std::max<size_t>(capacity, 1);
    TrimToCapacity();
}

void History::LoadStacks(Stack undoStack, Stack redoStack) {
    m_undoStack = std::move(undoStack);
    m_redoStack = std::move(redoStack);
    TrimToCapacity();
}

void History::TrimToCapacity() {
    if (m_undoStack.size() > m_capacity) {
        size_t excess = m_undoStack.size() - m_capacity;
        m_undoStack.erase(m_undoStack.begin(), 
                          m_undoStack.begin() + excess);
    }
}

} // namespace GridPlanner
