#include "core/grid.h"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace kaku
{
Grid::Grid()
    : Grid(kDefaultWidth, kDefaultHeight)
{
}

Grid::Grid(int width, int height)
    : m_width(ClampDimension(width))
    , m_height(ClampDimension(height))
    , m_cells((size_t)m_width * (size_t)m_height, DefaultCell())
{
}

int Grid::ClampDimension(int v)
{
    return std::clamp(v, kMinDimension, kMaxDimension);
}

std::optional<Cell> Grid::Get(int x, int y) const
{
    if (!InBounds(x, y))
        return std::nullopt;
    return m_cells[(size_t)y * (size_t)m_width + (size_t)x];
}

void Grid::Set(int x, int y, const Cell& cell)
{
    if (!InBounds(x, y))
        return;
    m_cells[(size_t)y * (size_t)m_width + (size_t)x] = cell;
}

void Grid::Clear()
{
    std::fill(m_cells.begin(), m_cells.end(), DefaultCell());
}

void Grid::Resize(int width, int height)
{
    const int w = ClampDimension(width);
    const int h = ClampDimension(height);
    if (w == m_width && h == m_height)
        return;

    std::vector<Cell> cells((size_t)w * (size_t)h, DefaultCell());
    const int copy_w = std::min(w, m_width);
    const int copy_h = std::min(h, m_height);
    for (int y = 0; y < copy_h; ++y)
    {
        const auto src = m_cells.begin() + (std::ptrdiff_t)y * m_width;
        std::copy(src, src + copy_w, cells.begin() + (std::ptrdiff_t)y * w);
    }

    m_cells = std::move(cells);
    m_width = w;
    m_height = h;
}

int Grid::CountNonEmpty() const
{
    return (int)std::count_if(m_cells.begin(), m_cells.end(), [](const Cell& c) { return !c.IsEmpty(); });
}
} // namespace kaku
