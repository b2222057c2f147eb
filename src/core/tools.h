#pragma once

#include "core/cell.h"
#include "core/grid.h"
#include "core/history.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace kaku::tools
{
// Drawing tools. Every function here is pure: it reads the grid and returns the
// mutations the tool would make, never writing to the grid itself. A mutation is
// only emitted where old != next, and positions outside the grid are skipped.

enum class ToolKind : std::uint8_t
{
    Pencil = 0,
    Eraser,
    Line,
    Rectangle,
    Fill,
    Eyedropper,
};

const std::array<ToolKind, 6>& AllTools();
std::string_view ToolName(ToolKind k);
char ToolKey(ToolKind k);
std::optional<ToolKind> ToolFromName(std::string_view name);

// Line and Rectangle need two clicks.
constexpr bool IsTwoPointTool(ToolKind k) { return k == ToolKind::Line || k == ToolKind::Rectangle; }

struct Point
{
    int x = 0;
    int y = 0;

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

// Two-click tool state, owned by the caller.
struct Idle
{
};
struct AwaitingSecondPoint
{
    int x = 0;
    int y = 0;
};
using ToolState = std::variant<Idle, AwaitingSecondPoint>;

// First click stores the corner and returns nullopt; the second click returns
// the stored corner and resets the state to Idle.
std::optional<Point> ClickTwoPointTool(ToolState& state, int x, int y);

// Integer Bresenham from (x0,y0) to (x1,y1), both endpoints included.
// Yields max(|dx|,|dy|)+1 points; swapping the endpoints yields the same set.
// Unclipped: the result grows with the distance. Line() walks only the part
// that lands on the grid.
std::vector<Point> BresenhamLine(int x0, int y0, int x1, int y1);

std::vector<CellMutation> Pencil(const Grid& grid, int x, int y,
                                 Glyph glyph, std::optional<Rgb8> fg, std::optional<Rgb8> bg);

// Resets the cell to DefaultCell().
std::vector<CellMutation> Eraser(const Grid& grid, int x, int y);

// Cost is bounded by the grid size, not by how far the endpoints lie off it.
std::vector<CellMutation> Line(const Grid& grid, int x0, int y0, int x1, int y1,
                               Glyph glyph, std::optional<Rgb8> fg, std::optional<Rgb8> bg);

// Axis-aligned box between two corners (any order). Outline unless `filled`.
std::vector<CellMutation> Rectangle(const Grid& grid, int x0, int y0, int x1, int y1,
                                    Glyph glyph, std::optional<Rgb8> fg, std::optional<Rgb8> bg,
                                    bool filled);

// 4-connected fill of every cell reachable from the seed that equals the seed's
// original value. Iterative (explicit stack); each cell is visited at most once.
std::vector<CellMutation> FloodFill(const Grid& grid, int x, int y,
                                    Glyph glyph, std::optional<Rgb8> fg, std::optional<Rgb8> bg);

// Read-only: the cell under (x,y), or nullopt outside the grid.
std::optional<Cell> Eyedropper(const Grid& grid, int x, int y);
} // namespace kaku::tools
