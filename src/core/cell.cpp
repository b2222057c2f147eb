#include "core/cell.h"

namespace kaku
{
std::optional<ResolvedCell> ResolveCell(const Cell& cell)
{
    if (!glyph::IsHalfBlock(cell.glyph))
        return std::nullopt;

    // Normalize to canonical (Upper / Left) form: primary = top/left half, secondary = bottom/right.
    const bool vertical = glyph::IsVerticalHalf(cell.glyph);
    const Glyph canonical = vertical ? glyph::kUpperHalf : glyph::kLeftHalf;
    const Glyph flipped = vertical ? glyph::kLowerHalf : glyph::kRightHalf;
    const bool swapped = (cell.glyph == flipped);

    const std::optional<Rgb8> primary = swapped ? cell.bg : cell.fg;
    const std::optional<Rgb8> secondary = swapped ? cell.fg : cell.bg;

    ResolvedCell out;
    if (primary && secondary)
    {
        out.glyph = canonical;
        out.fg = primary;
        out.bg = secondary;
    }
    else if (primary)
    {
        out.glyph = canonical;
        out.fg = primary;
    }
    else if (secondary)
    {
        out.glyph = flipped;
        out.fg = secondary;
    }
    else
    {
        out.glyph = glyph::kEmpty;
    }
    return out;
}

ResolvedCell DisplayForm(const Cell& cell)
{
    if (std::optional<ResolvedCell> r = ResolveCell(cell))
        return *r;
    return ResolvedCell{cell.glyph, cell.fg, cell.bg};
}

Cell ComposeCell(const Cell& /*existing*/, Glyph glyph, std::optional<Rgb8> fg, std::optional<Rgb8> bg)
{
    Cell c;
    c.glyph = glyph;
    c.fg = fg;
    c.bg = bg;
    return c;
}
} // namespace kaku
