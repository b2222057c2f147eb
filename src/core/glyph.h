#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kaku
{
// Glyph stored in canvas cells: a Unicode scalar from a fixed, closed set of block
// elements (see glyph::All()). Anything outside the set is never written by tools.
using Glyph = char32_t;

namespace glyph
{
static constexpr Glyph kEmpty = U' ';
static constexpr Glyph kFull  = U'\u2588'; // █

// Half blocks. Canonical forms are Upper and Left: fg = top/left half, bg = bottom/right half.
static constexpr Glyph kUpperHalf = U'\u2580'; // ▀
static constexpr Glyph kLowerHalf = U'\u2584'; // ▄
static constexpr Glyph kLeftHalf  = U'\u258C'; // ▌
static constexpr Glyph kRightHalf = U'\u2590'; // ▐

// Shades
static constexpr Glyph kLightShade  = U'\u2591'; // ░
static constexpr Glyph kMediumShade = U'\u2592'; // ▒
static constexpr Glyph kDarkShade   = U'\u2593'; // ▓

// Vertical fractional fills (lower N/8). 4/8 is kLowerHalf, 8/8 is kFull.
static constexpr Glyph kLower1_8 = U'\u2581'; // ▁
static constexpr Glyph kLower2_8 = U'\u2582'; // ▂
static constexpr Glyph kLower3_8 = U'\u2583'; // ▃
static constexpr Glyph kLower5_8 = U'\u2585'; // ▅
static constexpr Glyph kLower6_8 = U'\u2586'; // ▆
static constexpr Glyph kLower7_8 = U'\u2587'; // ▇

// Horizontal fractional fills (left N/8). 4/8 is kLeftHalf, 8/8 is kFull.
static constexpr Glyph kLeft1_8 = U'\u258F'; // ▏
static constexpr Glyph kLeft2_8 = U'\u258E'; // ▎
static constexpr Glyph kLeft3_8 = U'\u258D'; // ▍
static constexpr Glyph kLeft5_8 = U'\u258B'; // ▋
static constexpr Glyph kLeft6_8 = U'\u258A'; // ▊
static constexpr Glyph kLeft7_8 = U'\u2589'; // ▉

enum class Kind : std::uint8_t
{
    Empty = 0,
    Full,
    HalfBlock,
    Shade,
    VerticalFill,
    HorizontalFill,
    Unknown,
};

constexpr Kind GetKind(Glyph g)
{
    switch (g)
    {
        case kEmpty: return Kind::Empty;
        case kFull: return Kind::Full;
        case kUpperHalf:
        case kLowerHalf:
        case kLeftHalf:
        case kRightHalf: return Kind::HalfBlock;
        case kLightShade:
        case kMediumShade:
        case kDarkShade: return Kind::Shade;
        case kLower1_8:
        case kLower2_8:
        case kLower3_8:
        case kLower5_8:
        case kLower6_8:
        case kLower7_8: return Kind::VerticalFill;
        case kLeft1_8:
        case kLeft2_8:
        case kLeft3_8:
        case kLeft5_8:
        case kLeft6_8:
        case kLeft7_8: return Kind::HorizontalFill;
        default: return Kind::Unknown;
    }
}

constexpr bool IsKnown(Glyph g) { return GetKind(g) != Kind::Unknown; }
constexpr bool IsHalfBlock(Glyph g) { return GetKind(g) == Kind::HalfBlock; }
constexpr bool IsVerticalHalf(Glyph g) { return g == kUpperHalf || g == kLowerHalf; }
constexpr bool IsHorizontalHalf(Glyph g) { return g == kLeftHalf || g == kRightHalf; }

// Every glyph of the taxonomy, Empty first, in cycling order.
const std::vector<Glyph>& All();

// Stable serialization name ("Full", "UpperHalf", "Lower3_8", ...). Unknown glyphs -> "Full".
std::string_view Name(Glyph g);

// Inverse of Name(). Returns nullopt for names outside the taxonomy.
std::optional<Glyph> FromName(std::string_view name);

// Next drawable glyph (skips Empty). Empty and unknown glyphs cycle to Full.
Glyph Next(Glyph g);

// UTF-8 encoding of a single glyph.
std::string ToUtf8(Glyph g);
} // namespace glyph
} // namespace kaku
