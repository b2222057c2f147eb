#pragma once

#include "core/cell.h"

#include <optional>
#include <vector>

namespace kaku
{
// Bounded 2D array of cells (row-major). Pure storage: no undo, no compositing.
//
// Both dimensions are clamped to [kMinDimension, kMaxDimension] on construction
// and resize. Access is bounds-checked: out-of-range Get() returns nullopt and
// out-of-range Set() is a silent no-op, so tools can step past edges freely.
class Grid
{
public:
    static constexpr int kMinDimension = 8;
    static constexpr int kMaxDimension = 128;
    static constexpr int kDefaultWidth = 32;
    static constexpr int kDefaultHeight = 32;

    Grid();
    Grid(int width, int height);

    static int ClampDimension(int v);

    int Width() const { return m_width; }
    int Height() const { return m_height; }

    bool InBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_width && y < m_height; }

    std::optional<Cell> Get(int x, int y) const;
    void Set(int x, int y, const Cell& cell);

    // Resets every cell to DefaultCell().
    void Clear();

    // Clamps, keeps the overlapping top-left region, default-fills the rest.
    void Resize(int width, int height);

    // Row-major cell storage (size == Width() * Height()), for serialization.
    const std::vector<Cell>& Cells() const { return m_cells; }

    // Number of non-empty cells.
    int CountNonEmpty() const;

    bool operator==(const Grid& o) const
    {
        return m_width == o.m_width && m_height == o.m_height && m_cells == o.m_cells;
    }
    bool operator!=(const Grid& o) const { return !(*this == o); }

private:
    int m_width = kDefaultWidth;
    int m_height = kDefaultHeight;
    std::vector<Cell> m_cells;
};
} // namespace kaku
