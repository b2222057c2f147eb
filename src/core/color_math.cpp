#include "core/color_math.h"

#include "core/xterm256_palette.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kaku::color
{
namespace
{
constexpr std::array<std::string_view, 16> kStandardNames = {
    "Black",       "Red",       "Green",       "Yellow",       "Blue",       "Magenta",       "Cyan",       "White",
    "BrightBlack", "BrightRed", "BrightGreen", "BrightYellow", "BrightBlue", "BrightMagenta", "BrightCyan", "BrightWhite",
};

constexpr std::array<std::uint8_t, 24> kDefaultPaletteIndices = {
    // Neutrals
    0, 236, 244, 250, 255, 15,
    // Warm
    1, 196, 208, 214, 226, 229,
    // Cool
    22, 46, 30, 39, 21, 54,
    // Accent
    200, 213, 93, 180, 137, 94,
};

static inline std::uint8_t RoundToByte(double v)
{
    const double r = std::round(v);
    if (r <= 0.0) return 0;
    if (r >= 255.0) return 255;
    return (std::uint8_t)r;
}

// Hue angle (0..359, truncated) or nullopt for grays.
static std::optional<int> HueDegrees(std::uint8_t r, std::uint8_t g, std::uint8_t b)
{
    const std::uint8_t mx = std::max({r, g, b});
    const std::uint8_t mn = std::min({r, g, b});
    const double delta = (double)(mx - mn);
    if (delta < 1.0)
        return std::nullopt;

    const double rf = r, gf = g, bf = b;
    double hue = 0.0;
    if (mx == r)
        hue = 60.0 * std::fmod((gf - bf) / delta, 6.0);
    else if (mx == g)
        hue = 60.0 * (((bf - rf) / delta) + 2.0);
    else
        hue = 60.0 * (((rf - gf) / delta) + 4.0);
    if (hue < 0.0)
        hue += 360.0;
    return (int)hue % 360;
}
} // namespace

Hsl RgbToHsl(std::uint8_t r, std::uint8_t g, std::uint8_t b)
{
    const double rf = r / 255.0;
    const double gf = g / 255.0;
    const double bf = b / 255.0;

    const double mx = std::max({rf, gf, bf});
    const double mn = std::min({rf, gf, bf});
    const double l = (mx + mn) / 2.0;

    Hsl out;
    if (r == g && g == b)
    {
        out.l = (std::uint8_t)std::min(100.0, std::round(l * 100.0));
        return out;
    }

    const double delta = mx - mn;
    const double s = (l > 0.5) ? delta / (2.0 - mx - mn) : delta / (mx + mn);

    double h = 0.0;
    if (mx == rf)
    {
        h = (gf - bf) / delta;
        if (h < 0.0)
            h += 6.0;
    }
    else if (mx == gf)
        h = (bf - rf) / delta + 2.0;
    else
        h = (rf - gf) / delta + 4.0;

    int hdeg = (int)std::round(h * 60.0) % 360;
    if (hdeg < 0)
        hdeg += 360;

    out.h = (std::uint16_t)hdeg;
    out.s = (std::uint8_t)std::min(100.0, std::round(s * 100.0));
    out.l = (std::uint8_t)std::min(100.0, std::round(l * 100.0));
    return out;
}

Rgb8 HslToRgb(std::uint16_t h, std::uint8_t s, std::uint8_t l)
{
    const double sf = std::min<int>(s, 100) / 100.0;
    const double lf = std::min<int>(l, 100) / 100.0;
    const int    hi = h % 360;
    const double hf = (double)hi;

    if (s == 0)
    {
        const std::uint8_t v = RoundToByte(lf * 255.0);
        return Rgb8{v, v, v};
    }

    const double c = (1.0 - std::fabs(2.0 * lf - 1.0)) * sf;
    const double x = c * (1.0 - std::fabs(std::fmod(hf / 60.0, 2.0) - 1.0));
    const double m = lf - c / 2.0;

    double r1 = 0.0, g1 = 0.0, b1 = 0.0;
    switch (hi / 60)
    {
        case 0: r1 = c; g1 = x; break;
        case 1: r1 = x; g1 = c; break;
        case 2: g1 = c; b1 = x; break;
        case 3: g1 = x; b1 = c; break;
        case 4: r1 = x; b1 = c; break;
        default: r1 = c; b1 = x; break;
    }

    return Rgb8{RoundToByte((r1 + m) * 255.0), RoundToByte((g1 + m) * 255.0), RoundToByte((b1 + m) * 255.0)};
}

std::uint8_t Nearest256(const Rgb8& c)
{
    return (std::uint8_t)std::clamp(xterm256::NearestIndex(c.r, c.g, c.b), 0, 255);
}

std::uint8_t Nearest16(const Rgb8& c)
{
    return (std::uint8_t)std::clamp(xterm256::NearestIndex16(c.r, c.g, c.b), 0, 15);
}

Rgb8 RgbForIndex(int idx)
{
    const xterm256::Rgb& p = xterm256::RgbForIndex(idx);
    return Rgb8{p.r, p.g, p.b};
}

std::string IndexName(std::uint8_t idx)
{
    if (idx < kStandardNames.size())
        return std::string(kStandardNames[idx]);
    return "#" + std::to_string((int)idx);
}

std::optional<std::uint8_t> IndexFromLegacyName(std::string_view name)
{
    for (std::size_t i = 0; i < kStandardNames.size(); ++i)
    {
        if (kStandardNames[i] == name)
            return (std::uint8_t)i;
    }
    return std::nullopt;
}

std::optional<Rgb8> ParseHexColor(std::string_view s)
{
    if (!s.empty() && s[0] == '#')
        s.remove_prefix(1);
    if (s.size() != 6)
        return std::nullopt;

    auto nyb = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };
    auto byte_at = [&](size_t i) -> int {
        const int hi = nyb(s[i + 0]);
        const int lo = nyb(s[i + 1]);
        if (hi < 0 || lo < 0)
            return -1;
        return (hi << 4) | lo;
    };

    const int r = byte_at(0);
    const int g = byte_at(2);
    const int b = byte_at(4);
    if (r < 0 || g < 0 || b < 0)
        return std::nullopt;
    return Rgb8{(std::uint8_t)r, (std::uint8_t)g, (std::uint8_t)b};
}

std::string ToHex(const Rgb8& c)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string s = "#";
    for (std::uint8_t v : {c.r, c.g, c.b})
    {
        s.push_back(kHex[(v >> 4) & 0xFu]);
        s.push_back(kHex[v & 0xFu]);
    }
    return s;
}

const std::vector<Rgb8>& DefaultPalette()
{
    static const std::vector<Rgb8> palette = [] {
        std::vector<Rgb8> out;
        out.reserve(kDefaultPaletteIndices.size());
        for (std::uint8_t idx : kDefaultPaletteIndices)
            out.push_back(RgbForIndex(idx));
        return out;
    }();
    return palette;
}

std::vector<HueGroup> BuildHueGroups()
{
    std::vector<HueGroup> groups = {
        {"Reds", {}},  {"Oranges", {}}, {"Yellows", {}}, {"Greens", {}},
        {"Cyans", {}}, {"Blues", {}},   {"Purples", {}}, {"Pinks", {}},
    };
    std::vector<std::uint8_t> neutrals;

    for (int idx = 16; idx <= 231; ++idx)
    {
        const Rgb8 c = RgbForIndex(idx);
        const std::optional<int> hue = HueDegrees(c.r, c.g, c.b);
        if (!hue)
        {
            neutrals.push_back((std::uint8_t)idx);
            continue;
        }

        const int h = *hue;
        size_t g = 0;
        if (h <= 14 || h >= 346) g = 0;
        else if (h <= 39) g = 1;
        else if (h <= 69) g = 2;
        else if (h <= 159) g = 3;
        else if (h <= 199) g = 4;
        else if (h <= 259) g = 5;
        else if (h <= 299) g = 6;
        else g = 7;
        groups[g].indices.push_back((std::uint8_t)idx);
    }

    groups[0].indices.insert(groups[0].indices.end(), neutrals.begin(), neutrals.end());
    return groups;
}
} // namespace kaku::color
