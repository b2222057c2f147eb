#pragma once

#include "core/cell.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace kaku
{
class Grid;

// Immutable before/after record of one cell.
// `old` must be the grid's actual value at apply time (see EditSession::ApplyMutations).
struct CellMutation
{
    int  x = 0;
    int  y = 0;
    Cell old;
    Cell next;
};

// One undo unit: mutations applied/reverted atomically.
struct Action
{
    std::vector<CellMutation> mutations;
};

// Bounded linear undo/redo over committed Actions.
//
// Idle / StrokeActive: between BeginStroke() and EndStroke() pushed mutations are
// buffered and committed as a single Action (drag gestures). Outside a stroke each
// pushed mutation is committed on its own.
class History
{
public:
    static constexpr size_t kMaxActions = 256;

    // Opens an empty pending buffer, discarding any unflushed one.
    void BeginStroke();
    // Appends to the pending buffer, or commits a singleton Action when Idle.
    void PushMutation(const CellMutation& m);
    // Commits the pending buffer if non-empty and returns to Idle.
    void EndStroke();

    // No-op for empty actions. Otherwise clears redo, pushes, evicts the oldest past kMaxActions.
    void Commit(Action action);

    // Re-applies `old` values in reverse order. Returns false if nothing to undo.
    bool Undo(Grid& grid);
    // Re-applies `next` values in forward order. Returns false if nothing to redo.
    bool Redo(Grid& grid);

    bool CanUndo() const { return !m_undo_stack.empty(); }
    bool CanRedo() const { return !m_redo_stack.empty(); }
    bool IsStrokeActive() const { return m_pending.has_value(); }

    size_t UndoDepth() const { return m_undo_stack.size(); }
    size_t RedoDepth() const { return m_redo_stack.size(); }

    // Drops both stacks and any pending stroke (used when the grid is replaced).
    void Clear();

private:
    std::vector<Action> m_undo_stack;
    std::vector<Action> m_redo_stack;
    std::optional<std::vector<CellMutation>> m_pending;
};
} // namespace kaku
