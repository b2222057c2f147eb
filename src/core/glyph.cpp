#include "core/glyph.h"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kaku::glyph
{
namespace
{
struct NamedGlyph
{
    Glyph            g;
    std::string_view name;
};

constexpr std::array<NamedGlyph, 21> kNamed = {{
    {kEmpty, "Empty"},
    {kFull, "Full"},
    {kUpperHalf, "UpperHalf"},
    {kLowerHalf, "LowerHalf"},
    {kLeftHalf, "LeftHalf"},
    {kRightHalf, "RightHalf"},
    {kLightShade, "LightShade"},
    {kMediumShade, "MediumShade"},
    {kDarkShade, "DarkShade"},
    {kLower1_8, "Lower1_8"},
    {kLower2_8, "Lower2_8"},
    {kLower3_8, "Lower3_8"},
    {kLower5_8, "Lower5_8"},
    {kLower6_8, "Lower6_8"},
    {kLower7_8, "Lower7_8"},
    {kLeft1_8, "Left1_8"},
    {kLeft2_8, "Left2_8"},
    {kLeft3_8, "Left3_8"},
    {kLeft5_8, "Left5_8"},
    {kLeft6_8, "Left6_8"},
    {kLeft7_8, "Left7_8"},
}};
} // namespace

const std::vector<Glyph>& All()
{
    static const std::vector<Glyph> all = [] {
        std::vector<Glyph> out;
        out.reserve(kNamed.size());
        for (const NamedGlyph& n : kNamed)
            out.push_back(n.g);
        return out;
    }();
    return all;
}

std::string_view Name(Glyph g)
{
    for (const NamedGlyph& n : kNamed)
    {
        if (n.g == g)
            return n.name;
    }
    return "Full";
}

std::optional<Glyph> FromName(std::string_view name)
{
    for (const NamedGlyph& n : kNamed)
    {
        if (n.name == name)
            return n.g;
    }
    return std::nullopt;
}

Glyph Next(Glyph g)
{
    // kNamed[0] is Empty; drawable glyphs are kNamed[1..].
    for (size_t i = 1; i < kNamed.size(); ++i)
    {
        if (kNamed[i].g == g)
            return (i + 1 < kNamed.size()) ? kNamed[i + 1].g : kNamed[1].g;
    }
    return kFull;
}

std::string ToUtf8(Glyph g)
{
    const std::uint32_t cp = (std::uint32_t)g;
    std::string out;
    if (cp <= 0x7F)
    {
        out.push_back((char)cp);
    }
    else if (cp <= 0x7FF)
    {
        out.push_back((char)(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0xFFFF)
    {
        out.push_back((char)(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back((char)(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
    return out;
}
} // namespace kaku::glyph
