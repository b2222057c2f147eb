#pragma once

#include "core/cell.h"
#include "core/grid.h"
#include "core/history.h"
#include "core/symmetry.h"
#include "core/tools.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace kaku
{
// Edit orchestrator: owns one document grid plus its history and the transient
// brush/tool state, and is the only place that sequences
//   tool mutations -> symmetry -> re-read old from the grid -> apply -> history.
//
// Grid, History and the tool functions stay independent values; EditSession is
// the glue an input loop drives (one ApplyTool per input event, strokes bracketed
// by BeginStroke/EndStroke).
class EditSession
{
public:
    static constexpr size_t kMaxRecentColors = 8;

    EditSession();
    explicit EditSession(Grid grid);

    // ---------------------------------------------------------------------
    // Document
    // ---------------------------------------------------------------------
    const Grid& GetGrid() const { return m_grid; }
    const History& GetHistory() const { return m_history; }

    // Replaces the grid with a blank one. History and tool state are reset.
    void NewCanvas(int width, int height);
    // Replaces the grid wholesale (project load). History and tool state are reset.
    void ReplaceGrid(Grid grid);
    // Resizes in place. History is reset since recorded coordinates may no longer exist.
    void Resize(int width, int height);

    // Dirty tracking against the last MarkSaved() call.
    bool IsDirty() const { return m_state_token != m_saved_state_token; }
    void MarkSaved() { m_saved_state_token = m_state_token; }

    // ---------------------------------------------------------------------
    // Brush / tool state (not part of the document, not undo-tracked)
    // ---------------------------------------------------------------------
    Glyph GetActiveGlyph() const { return m_glyph; }
    void  SetActiveGlyph(Glyph g) { m_glyph = g; }
    void  CycleGlyph() { m_glyph = glyph::Next(m_glyph); }

    const std::optional<Rgb8>& GetForeground() const { return m_fg; }
    const std::optional<Rgb8>& GetBackground() const { return m_bg; }
    void SetForeground(std::optional<Rgb8> c) { m_fg = c; }
    void SetBackground(std::optional<Rgb8> c) { m_bg = c; }

    tools::ToolKind GetActiveTool() const { return m_tool; }
    // Switching tools abandons a half-finished two-click gesture.
    void SetActiveTool(tools::ToolKind k);
    const tools::ToolState& GetToolState() const { return m_tool_state; }
    void CancelTool() { m_tool_state = tools::Idle{}; }

    SymmetryMode GetSymmetry() const { return m_symmetry; }
    void SetSymmetry(SymmetryMode m) { m_symmetry = m; }
    void ToggleHorizontalSymmetry() { m_symmetry = ToggleHorizontal(m_symmetry); }
    void ToggleVerticalSymmetry() { m_symmetry = ToggleVertical(m_symmetry); }

    bool GetFilledRect() const { return m_filled_rect; }
    void SetFilledRect(bool filled) { m_filled_rect = filled; }

    // Most recent first, no duplicates.
    const std::vector<Rgb8>& GetRecentColors() const { return m_recent_colors; }

    // ---------------------------------------------------------------------
    // Editing
    // ---------------------------------------------------------------------
    // Applies the active tool at (x,y). Returns the number of cells changed.
    // Line/Rectangle: the first call only records the corner. Eyedropper picks
    // glyph/colors into the brush and never changes the grid.
    size_t ApplyTool(int x, int y);

    // Expands `proposed` through the current symmetry mode, re-derives each
    // mutation's `old` from the live grid, recomposes `next` against it, drops
    // no-ops and out-of-range positions and applies the rest in order. Outside a
    // stroke the applied mutations are committed as one Action; inside a stroke
    // they join the pending buffer. Returns the number of mutations applied.
    size_t ApplyMutations(const std::vector<CellMutation>& proposed);

    // Drag gesture bracketing: everything applied in between is one undo step.
    void BeginStroke() { m_history.BeginStroke(); }
    void EndStroke() { m_history.EndStroke(); }

    bool Undo();
    bool Redo();
    bool CanUndo() const { return m_history.CanUndo(); }
    bool CanRedo() const { return m_history.CanRedo(); }

private:
    void TrackRecentColor(const Rgb8& c);
    void Touch();

    Grid    m_grid;
    History m_history;

    Glyph               m_glyph = glyph::kFull;
    std::optional<Rgb8> m_fg = kDefaultFg;
    std::optional<Rgb8> m_bg;

    tools::ToolKind  m_tool = tools::ToolKind::Pencil;
    tools::ToolState m_tool_state = tools::Idle{};
    SymmetryMode     m_symmetry = SymmetryMode::Off;
    bool             m_filled_rect = false;

    std::vector<Rgb8> m_recent_colors;

    // Monotonic content token for dirty tracking; 0 is never used.
    std::uint64_t m_state_token = 1;
    std::uint64_t m_saved_state_token = 1;
};
} // namespace kaku
