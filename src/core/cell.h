#pragma once

#include "core/color_math.h"
#include "core/glyph.h"

#include <optional>

namespace kaku
{
using color::Rgb8;

// Default foreground for fresh cells (xterm index 7).
static constexpr Rgb8 kDefaultFg = Rgb8{229, 229, 229};

// The per-position drawable unit.
//  - fg/bg nullopt means "unset": theme default for fg, transparent for bg.
//  - Half-block cells keep whatever orientation + fg/bg pair the tool wrote;
//    interpretation goes through ResolveCell().
struct Cell
{
    Glyph               glyph = glyph::kEmpty;
    std::optional<Rgb8> fg = kDefaultFg;
    std::optional<Rgb8> bg;

    bool IsEmpty() const { return glyph == glyph::kEmpty; }

    bool operator==(const Cell& o) const { return glyph == o.glyph && fg == o.fg && bg == o.bg; }
    bool operator!=(const Cell& o) const { return !(*this == o); }
};

inline Cell DefaultCell() { return Cell{}; }

// Display form of a half-block cell after orientation normalization and
// transparency resolution. Never stored.
struct ResolvedCell
{
    Glyph               glyph = glyph::kEmpty;
    std::optional<Rgb8> fg;
    std::optional<Rgb8> bg;

    bool operator==(const ResolvedCell& o) const { return glyph == o.glyph && fg == o.fg && bg == o.bg; }
    bool operator!=(const ResolvedCell& o) const { return !(*this == o); }
};

// Returns nullopt for non-half-block glyphs. For half blocks:
//  - Lower/Right are first normalized to Upper/Left (the halves swap fg/bg roles).
//  - Both halves opaque   -> canonical glyph, fg = top/left, bg = bottom/right.
//  - One half transparent -> glyph showing only the opaque half, fg = its color, bg unset.
//  - Both transparent     -> (' ', unset, unset).
// Resolving a resolved result yields the same result.
std::optional<ResolvedCell> ResolveCell(const Cell& cell);

// What a renderer/exporter draws: ResolveCell() for half blocks, the cell as-is otherwise.
ResolvedCell DisplayForm(const Cell& cell);

// Full replacement: `existing` is discarded. Half blocks stamp cleanly and do not
// merge with whatever was underneath (Lower over Upper does not become Full).
Cell ComposeCell(const Cell& existing, Glyph glyph, std::optional<Rgb8> fg, std::optional<Rgb8> bg);
} // namespace kaku
