#pragma once

#include "ICommand.h"
#include "../Limits.h"
#include <functional>
#include <memory>
#include <vector>
#include <string>

namespace GridPlanner {

/**
 * Undo/redo history of one user.
 * The undo stack is bounded; the oldest entry is evicted first. The redo
 * stack is cleared whenever a new command is added.
 */
class History {
public:
    using CommandPtr = std::unique_ptr<ICommand>;
    using Stack = std::vector<CommandPtr>;
    
    explicit History(size_t capacity = Limits::DEFAULT_UNDO_CAPACITY);
    
    /**
     * Add a command to the history.
     * @param cmd Command to add (transfers ownership via unique_ptr)
     * @param store Store to operate on (borrowed reference)
     * @param events Receives change notifications
     * @param execute If true, executes the command; if false, assumes 
     *                already applied
     * @return false if execution failed (nothing was pushed)
     */
    bool AddCommand(CommandPtr cmd, Store& store, ChangeDispatcher& events,
                    bool execute = true);
    
    /**
     * Undo the last command.
     * @return false if there was nothing to undo
     */
    bool Undo(Store& store, ChangeDispatcher& events);
    
    /**
     * Redo the next command.
     * @return false if there was nothing to redo
     */
    bool Redo(Store& store, ChangeDispatcher& events);
    
    /**
     * Clear all history.
     */
    void Clear();
    
    /**
     * Drop every entry (undo and redo) matching a predicate.
     * @return Number of entries removed
     */
    size_t RemoveIf(const std::function<bool(const ICommand&)>& predicate);
    
    bool CanUndo() const;
    bool CanRedo() const;
    
    /**
     * Description of the command Undo would revert ("" if none).
     */
    std::string GetUndoDescription() const;
    
    /**
     * Description of the command Redo would apply ("" if none).
     */
    std::string GetRedoDescription() const;
    
    size_t GetUndoCount() const { return m_undoStack.size(); }
    size_t GetRedoCount() const { return m_redoStack.size(); }
    
    size_t GetCapacity() const { return m_capacity; }
    
    /**
     * Change the undo bound, evicting the oldest entries if needed.
     */
    void SetCapacity(size_t capacity);
    
    // Bottom of the stack first
    const Stack& GetUndoStack() const { return m_undoStack; }
    const Stack& GetRedoStack() const { return m_redoStack; }
    
    /**
     * Replace both stacks without executing anything (snapshot loading).
     */
    void LoadStacks(Stack undoStack, Stack redoStack);
    
private:
    void TrimToCapacity();
    
    Stack m_undoStack;
    Stack m_redoStack;
    size_t m_capacity;
};

} // namespace GridPlanner
