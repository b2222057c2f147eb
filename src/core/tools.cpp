#include "core/tools.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace kaku::tools
{
namespace
{
constexpr std::array<ToolKind, 6> kAllTools = {
    ToolKind::Pencil, ToolKind::Eraser, ToolKind::Line, ToolKind::Rectangle, ToolKind::Fill, ToolKind::Eyedropper,
};

// Emits a mutation for (x,y) if it is in range and would change the cell.
static void EmitIfChanged(const Grid& grid, int x, int y, const Cell& next, std::vector<CellMutation>& out)
{
    const std::optional<Cell> old = grid.Get(x, y);
    if (!old || *old == next)
        return;
    out.push_back(CellMutation{x, y, *old, next});
}

// A line as a walk along its major axis: step i moves i cells along the major
// axis and round(i * minor / steps) cells across it (ties away from the start).
// Endpoints are ordered lexicographically first, so (a,b) and (b,a) produce the
// same cells. All arithmetic is 64-bit; any pair of int endpoints is safe.
struct LineWalk
{
    std::int64_t  x0 = 0;
    std::int64_t  y0 = 0;
    std::int64_t  sx = 1;
    std::int64_t  sy = 1;
    std::uint64_t steps = 0; // max(|dx|,|dy|)
    std::uint64_t minor = 0; // min(|dx|,|dy|)
    bool          x_major = true;

    Point At(std::uint64_t i) const
    {
        const std::int64_t along = (std::int64_t)i;
        const std::int64_t across = (steps == 0) ? 0 : (std::int64_t)((i * minor + steps / 2) / steps);
        if (x_major)
            return Point{(int)(x0 + sx * along), (int)(y0 + sy * across)};
        return Point{(int)(x0 + sx * across), (int)(y0 + sy * along)};
    }
};

static LineWalk MakeLineWalk(int x0, int y0, int x1, int y1)
{
    if (std::make_pair(x1, y1) < std::make_pair(x0, y0))
    {
        std::swap(x0, x1);
        std::swap(y0, y1);
    }

    const std::int64_t dx = (std::int64_t)x1 - (std::int64_t)x0;
    const std::int64_t dy = (std::int64_t)y1 - (std::int64_t)y0;
    const std::uint64_t adx = (std::uint64_t)(dx < 0 ? -dx : dx);
    const std::uint64_t ady = (std::uint64_t)(dy < 0 ? -dy : dy);

    LineWalk w;
    w.x0 = x0;
    w.y0 = y0;
    w.sx = (dx < 0) ? -1 : 1;
    w.sy = (dy < 0) ? -1 : 1;
    w.x_major = (adx >= ady);
    w.steps = w.x_major ? adx : ady;
    w.minor = w.x_major ? ady : adx;
    return w;
}

// Narrows the walk to the steps whose major-axis coordinate is inside the grid.
// Returns false when no step is.
static bool ClipSteps(const LineWalk& w, int width, int height, std::uint64_t& first, std::uint64_t& last)
{
    const std::int64_t c0 = w.x_major ? w.x0 : w.y0;
    const std::int64_t s = w.x_major ? w.sx : w.sy;
    const std::int64_t limit = w.x_major ? width : height;

    std::int64_t lo = (s > 0) ? -c0 : c0 - (limit - 1);
    std::int64_t hi = (s > 0) ? (limit - 1) - c0 : c0;
    lo = std::max<std::int64_t>(lo, 0);
    hi = std::min<std::int64_t>(hi, (std::int64_t)w.steps);
    if (lo > hi)
        return false;
    first = (std::uint64_t)lo;
    last = (std::uint64_t)hi;
    return true;
}
} // namespace

const std::array<ToolKind, 6>& AllTools()
{
    return kAllTools;
}

std::string_view ToolName(ToolKind k)
{
    switch (k)
    {
        case ToolKind::Pencil: return "Pencil";
        case ToolKind::Eraser: return "Eraser";
        case ToolKind::Line: return "Line";
        case ToolKind::Rectangle: return "Rect";
        case ToolKind::Fill: return "Fill";
        case ToolKind::Eyedropper: return "Pick";
    }
    return "Pencil";
}

char ToolKey(ToolKind k)
{
    switch (k)
    {
        case ToolKind::Pencil: return 'P';
        case ToolKind::Eraser: return 'E';
        case ToolKind::Line: return 'L';
        case ToolKind::Rectangle: return 'R';
        case ToolKind::Fill: return 'F';
        case ToolKind::Eyedropper: return 'I';
    }
    return 'P';
}

std::optional<ToolKind> ToolFromName(std::string_view name)
{
    for (ToolKind k : kAllTools)
    {
        if (ToolName(k) == name)
            return k;
    }
    // Long-form aliases accepted on the command line.
    if (name == "pencil") return ToolKind::Pencil;
    if (name == "eraser") return ToolKind::Eraser;
    if (name == "line") return ToolKind::Line;
    if (name == "rect" || name == "rectangle") return ToolKind::Rectangle;
    if (name == "fill") return ToolKind::Fill;
    if (name == "pick" || name == "eyedropper") return ToolKind::Eyedropper;
    return std::nullopt;
}

std::optional<Point> ClickTwoPointTool(ToolState& state, int x, int y)
{
    if (const AwaitingSecondPoint* first = std::get_if<AwaitingSecondPoint>(&state))
    {
        const Point p{first->x, first->y};
        state = Idle{};
        return p;
    }
    state = AwaitingSecondPoint{x, y};
    return std::nullopt;
}

std::vector<Point> BresenhamLine(int x0, int y0, int x1, int y1)
{
    const LineWalk walk = MakeLineWalk(x0, y0, x1, y1);
    std::vector<Point> points;
    points.reserve((size_t)walk.steps + 1);
    for (std::uint64_t i = 0; i <= walk.steps; ++i)
        points.push_back(walk.At(i));
    return points;
}

std::vector<CellMutation> Pencil(const Grid& grid, int x, int y,
                                 Glyph glyph, std::optional<Rgb8> fg, std::optional<Rgb8> bg)
{
    std::vector<CellMutation> out;
    if (const std::optional<Cell> old = grid.Get(x, y))
        EmitIfChanged(grid, x, y, ComposeCell(*old, glyph, fg, bg), out);
    return out;
}

std::vector<CellMutation> Eraser(const Grid& grid, int x, int y)
{
    std::vector<CellMutation> out;
    EmitIfChanged(grid, x, y, DefaultCell(), out);
    return out;
}

std::vector<CellMutation> Line(const Grid& grid, int x0, int y0, int x1, int y1,
                               Glyph glyph, std::optional<Rgb8> fg, std::optional<Rgb8> bg)
{
    std::vector<CellMutation> out;
    const LineWalk walk = MakeLineWalk(x0, y0, x1, y1);
    std::uint64_t first = 0;
    std::uint64_t last = 0;
    if (!ClipSteps(walk, grid.Width(), grid.Height(), first, last))
        return out;

    for (std::uint64_t i = first; i <= last; ++i)
    {
        const Point p = walk.At(i);
        if (const std::optional<Cell> old = grid.Get(p.x, p.y))
            EmitIfChanged(grid, p.x, p.y, ComposeCell(*old, glyph, fg, bg), out);
    }
    return out;
}

std::vector<CellMutation> Rectangle(const Grid& grid, int x0, int y0, int x1, int y1,
                                    Glyph glyph, std::optional<Rgb8> fg, std::optional<Rgb8> bg,
                                    bool filled)
{
    const int min_x = std::min(x0, x1);
    const int max_x = std::max(x0, x1);
    const int min_y = std::min(y0, y1);
    const int max_y = std::max(y0, y1);

    // Walk only the on-grid part; border membership still uses the full box.
    const int lo_x = std::max(min_x, 0);
    const int hi_x = std::min(max_x, grid.Width() - 1);
    const int lo_y = std::max(min_y, 0);
    const int hi_y = std::min(max_y, grid.Height() - 1);

    std::vector<CellMutation> out;
    for (int y = lo_y; y <= hi_y; ++y)
    {
        for (int x = lo_x; x <= hi_x; ++x)
        {
            const bool border = (x == min_x || x == max_x || y == min_y || y == max_y);
            if (!filled && !border)
                continue;
            if (const std::optional<Cell> old = grid.Get(x, y))
                EmitIfChanged(grid, x, y, ComposeCell(*old, glyph, fg, bg), out);
        }
    }
    return out;
}

std::vector<CellMutation> FloodFill(const Grid& grid, int x, int y,
                                    Glyph glyph, std::optional<Rgb8> fg, std::optional<Rgb8> bg)
{
    const std::optional<Cell> seed = grid.Get(x, y);
    if (!seed)
        return {};

    const Cell target = *seed;
    const Cell next = ComposeCell(target, glyph, fg, bg);
    if (target == next)
        return {};

    const int w = grid.Width();
    const int h = grid.Height();
    std::vector<bool> visited((size_t)w * (size_t)h, false);
    std::vector<Point> stack;
    stack.push_back(Point{x, y});

    std::vector<CellMutation> out;
    while (!stack.empty())
    {
        const Point p = stack.back();
        stack.pop_back();
        if (!grid.InBounds(p.x, p.y))
            continue;

        const size_t idx = (size_t)p.y * (size_t)w + (size_t)p.x;
        if (visited[idx])
            continue;
        if (*grid.Get(p.x, p.y) != target)
            continue;

        visited[idx] = true;
        out.push_back(CellMutation{p.x, p.y, target, next});

        if (p.x > 0) stack.push_back(Point{p.x - 1, p.y});
        if (p.x + 1 < w) stack.push_back(Point{p.x + 1, p.y});
        if (p.y > 0) stack.push_back(Point{p.x, p.y - 1});
        if (p.y + 1 < h) stack.push_back(Point{p.x, p.y + 1});
    }
    return out;
}

std::optional<Cell> Eyedropper(const Grid& grid, int x, int y)
{
    return grid.Get(x, y);
}
} // namespace kaku::tools
