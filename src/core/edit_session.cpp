#include "core/edit_session.h"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace kaku
{
EditSession::EditSession() = default;

EditSession::EditSession(Grid grid)
    : m_grid(std::move(grid))
{
}

void EditSession::NewCanvas(int width, int height)
{
    ReplaceGrid(Grid(width, height));
}

void EditSession::ReplaceGrid(Grid grid)
{
    m_grid = std::move(grid);
    m_history.Clear();
    m_tool_state = tools::Idle{};
    Touch();
}

void EditSession::Resize(int width, int height)
{
    const int w = Grid::ClampDimension(width);
    const int h = Grid::ClampDimension(height);
    if (w == m_grid.Width() && h == m_grid.Height())
        return;
    m_grid.Resize(w, h);
    m_history.Clear();
    m_tool_state = tools::Idle{};
    Touch();
}

void EditSession::SetActiveTool(tools::ToolKind k)
{
    if (k != m_tool)
        m_tool_state = tools::Idle{};
    m_tool = k;
}

size_t EditSession::ApplyTool(int x, int y)
{
    using tools::ToolKind;

    std::vector<CellMutation> proposed;
    switch (m_tool)
    {
        case ToolKind::Pencil:
            proposed = tools::Pencil(m_grid, x, y, m_glyph, m_fg, m_bg);
            break;
        case ToolKind::Eraser:
            proposed = tools::Eraser(m_grid, x, y);
            break;
        case ToolKind::Fill:
            proposed = tools::FloodFill(m_grid, x, y, m_glyph, m_fg, m_bg);
            break;
        case ToolKind::Eyedropper:
        {
            const std::optional<Cell> picked = tools::Eyedropper(m_grid, x, y);
            if (!picked)
                return 0;
            m_fg = picked->fg;
            m_bg = picked->bg;
            if (!picked->IsEmpty())
                m_glyph = picked->glyph;
            if (picked->fg)
                TrackRecentColor(*picked->fg);
            return 0;
        }
        case ToolKind::Line:
        case ToolKind::Rectangle:
        {
            const std::optional<tools::Point> first = tools::ClickTwoPointTool(m_tool_state, x, y);
            if (!first)
                return 0;
            if (m_tool == ToolKind::Line)
                proposed = tools::Line(m_grid, first->x, first->y, x, y, m_glyph, m_fg, m_bg);
            else
                proposed = tools::Rectangle(m_grid, first->x, first->y, x, y, m_glyph, m_fg, m_bg, m_filled_rect);
            break;
        }
    }

    if (m_tool != ToolKind::Eraser && m_fg)
        TrackRecentColor(*m_fg);

    return ApplyMutations(proposed);
}

size_t EditSession::ApplyMutations(const std::vector<CellMutation>& proposed)
{
    if (proposed.empty())
        return 0;

    const std::vector<CellMutation> expanded =
        ApplySymmetry(proposed, m_symmetry, m_grid.Width(), m_grid.Height());

    // Mirrored copies carry the origin's `old`. Re-read every position right before
    // writing so undo restores what was really there (this also covers overlapping
    // mirrors that land on an already-written cell).
    Action action;
    for (const CellMutation& m : expanded)
    {
        const std::optional<Cell> actual_old = m_grid.Get(m.x, m.y);
        if (!actual_old)
            continue;

        CellMutation fixed = m;
        fixed.old = *actual_old;
        fixed.next = ComposeCell(*actual_old, m.next.glyph, m.next.fg, m.next.bg);
        if (fixed.old == fixed.next)
            continue;

        m_grid.Set(fixed.x, fixed.y, fixed.next);
        action.mutations.push_back(fixed);
    }

    const size_t applied = action.mutations.size();
    if (applied == 0)
        return 0;

    // Inside a stroke everything joins the pending buffer; otherwise one tool
    // application (fill, rectangle, mirrored pencil dab) is one undo step.
    if (m_history.IsStrokeActive())
    {
        for (const CellMutation& m : action.mutations)
            m_history.PushMutation(m);
    }
    else
    {
        m_history.Commit(std::move(action));
    }
    Touch();
    return applied;
}

bool EditSession::Undo()
{
    if (!m_history.Undo(m_grid))
        return false;
    Touch();
    return true;
}

bool EditSession::Redo()
{
    if (!m_history.Redo(m_grid))
        return false;
    Touch();
    return true;
}

void EditSession::TrackRecentColor(const Rgb8& c)
{
    auto it = std::find(m_recent_colors.begin(), m_recent_colors.end(), c);
    if (it != m_recent_colors.end())
        m_recent_colors.erase(it);
    m_recent_colors.insert(m_recent_colors.begin(), c);
    if (m_recent_colors.size() > kMaxRecentColors)
        m_recent_colors.resize(kMaxRecentColors);
}

void EditSession::Touch()
{
    // Avoid wrap to 0.
    ++m_state_token;
    if (m_state_token == 0)
        ++m_state_token;
}
} // namespace kaku
