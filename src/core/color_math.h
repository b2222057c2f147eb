#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kaku::color
{
// True 24-bit color. This is the only color representation stored in cells;
// palette indices exist only at quantization and legacy-input boundaries.
struct Rgb8
{
    std::uint8_t r = 0, g = 0, b = 0;

    bool operator==(const Rgb8& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb8& o) const { return !(*this == o); }
};

// h in [0,360), s and l in [0,100].
struct Hsl
{
    std::uint16_t h = 0;
    std::uint8_t  s = 0;
    std::uint8_t  l = 0;

    bool operator==(const Hsl& o) const { return h == o.h && s == o.s && l == o.l; }
    bool operator!=(const Hsl& o) const { return !(*this == o); }
};

// Achromatic inputs (max == min channel) yield h=0, s=0.
Hsl RgbToHsl(std::uint8_t r, std::uint8_t g, std::uint8_t b);
inline Hsl RgbToHsl(const Rgb8& c) { return RgbToHsl(c.r, c.g, c.b); }

// h is taken modulo 360; s and l are clamped to 100.
Rgb8 HslToRgb(std::uint16_t h, std::uint8_t s, std::uint8_t l);
inline Rgb8 HslToRgb(const Hsl& c) { return HslToRgb(c.h, c.s, c.l); }

// Quantization (deterministic; ties -> lowest index).
std::uint8_t Nearest256(const Rgb8& c);
std::uint8_t Nearest16(const Rgb8& c);

// Xterm-256 table lookups.
Rgb8 RgbForIndex(int idx);

// "Black".."BrightWhite" for 0..15, "#N" for the rest.
std::string IndexName(std::uint8_t idx);

// Inverse of IndexName() for the 16 standard names (used by legacy project files).
std::optional<std::uint8_t> IndexFromLegacyName(std::string_view name);

// Accepts "#RRGGBB" or "RRGGBB" (case-insensitive). Any other shape returns nullopt.
std::optional<Rgb8> ParseHexColor(std::string_view s);

// "#RRGGBB", upper case.
std::string ToHex(const Rgb8& c);

// Curated starting palette: 24 entries (neutrals, warm, cool, accent).
const std::vector<Rgb8>& DefaultPalette();

struct HueGroup
{
    std::string name;
    std::vector<std::uint8_t> indices; // xterm cube indices (16..231)
};

// Partitions the 216-entry color cube into eight hue groups.
// Every cube index appears exactly once; cube grays are placed in "Reds".
std::vector<HueGroup> BuildHueGroups();
} // namespace kaku::color
