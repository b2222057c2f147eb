#include "core/history.h"

#include "core/grid.h"

#include <utility>

namespace kaku
{
void History::BeginStroke()
{
    m_pending.emplace();
}

void History::PushMutation(const CellMutation& m)
{
    if (m_pending)
    {
        m_pending->push_back(m);
        return;
    }
    Action a;
    a.mutations.push_back(m);
    Commit(std::move(a));
}

void History::EndStroke()
{
    if (!m_pending)
        return;
    std::vector<CellMutation> mutations = std::move(*m_pending);
    m_pending.reset();
    if (!mutations.empty())
        Commit(Action{std::move(mutations)});
}

void History::Commit(Action action)
{
    if (action.mutations.empty())
        return;
    m_redo_stack.clear();
    m_undo_stack.push_back(std::move(action));
    if (m_undo_stack.size() > kMaxActions)
        m_undo_stack.erase(m_undo_stack.begin(),
                           m_undo_stack.begin() + (m_undo_stack.size() - kMaxActions));
}

bool History::Undo(Grid& grid)
{
    if (m_undo_stack.empty())
        return false;
    Action a = std::move(m_undo_stack.back());
    m_undo_stack.pop_back();
    for (auto it = a.mutations.rbegin(); it != a.mutations.rend(); ++it)
        grid.Set(it->x, it->y, it->old);
    m_redo_stack.push_back(std::move(a));
    return true;
}

bool History::Redo(Grid& grid)
{
    if (m_redo_stack.empty())
        return false;
    Action a = std::move(m_redo_stack.back());
    m_redo_stack.pop_back();
    for (const CellMutation& m : a.mutations)
        grid.Set(m.x, m.y, m.next);
    m_undo_stack.push_back(std::move(a));
    return true;
}

void History::Clear()
{
    m_undo_stack.clear();
    m_redo_stack.clear();
    m_pending.reset();
}
} // namespace kaku
