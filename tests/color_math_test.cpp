#include "core/color_math.h"
#include "core/xterm256_palette.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <set>

using kaku::color::Hsl;
using kaku::color::Rgb8;
namespace color = kaku::color;

TEST(ColorMathTest, RgbToHslPrimaries)
{
    EXPECT_EQ(color::RgbToHsl(255, 0, 0), (Hsl{0, 100, 50}));
    EXPECT_EQ(color::RgbToHsl(0, 255, 0), (Hsl{120, 100, 50}));
    EXPECT_EQ(color::RgbToHsl(0, 0, 255), (Hsl{240, 100, 50}));
}

TEST(ColorMathTest, RgbToHslAchromaticHasNoHue)
{
    EXPECT_EQ(color::RgbToHsl(0, 0, 0), (Hsl{0, 0, 0}));
    EXPECT_EQ(color::RgbToHsl(255, 255, 255), (Hsl{0, 0, 100}));
    const Hsl gray = color::RgbToHsl(128, 128, 128);
    EXPECT_EQ(gray.h, 0);
    EXPECT_EQ(gray.s, 0);
    EXPECT_EQ(gray.l, 50);
}

TEST(ColorMathTest, HslToRgbPrimaries)
{
    EXPECT_EQ(color::HslToRgb(0, 100, 50), (Rgb8{255, 0, 0}));
    EXPECT_EQ(color::HslToRgb(120, 100, 50), (Rgb8{0, 255, 0}));
    EXPECT_EQ(color::HslToRgb(240, 100, 50), (Rgb8{0, 0, 255}));
    EXPECT_EQ(color::HslToRgb(0, 0, 100), (Rgb8{255, 255, 255}));
}

TEST(ColorMathTest, HslToRgbWrapsHueAndClamps)
{
    EXPECT_EQ(color::HslToRgb(360, 100, 50), color::HslToRgb(0, 100, 50));
    EXPECT_EQ(color::HslToRgb(480, 100, 50), color::HslToRgb(120, 100, 50));
    EXPECT_EQ(color::HslToRgb(0, 200, 50), color::HslToRgb(0, 100, 50));
}

TEST(ColorMathTest, SaturatedColorsRoundTrip)
{
    for (const Rgb8 c : {Rgb8{255, 0, 0}, Rgb8{0, 255, 0}, Rgb8{0, 0, 255}, Rgb8{255, 255, 0},
                         Rgb8{0, 255, 255}, Rgb8{255, 0, 255}})
    {
        EXPECT_EQ(color::HslToRgb(color::RgbToHsl(c)), c);
    }
}

TEST(ColorMathTest, Nearest256)
{
    EXPECT_EQ(color::Nearest256(Rgb8{0, 0, 0}), 0);
    EXPECT_EQ(color::Nearest256(Rgb8{205, 0, 0}), 1);
    // (255,255,255) is both index 15 and 231; ties go to the lower index.
    EXPECT_EQ(color::Nearest256(Rgb8{255, 255, 255}), 15);
    EXPECT_EQ(color::Nearest256(Rgb8{8, 8, 8}), 232);
    EXPECT_EQ(color::Nearest256(Rgb8{255, 135, 0}), 208);
}

TEST(ColorMathTest, Nearest256IsExactForEveryPaletteEntry)
{
    for (int i = 0; i < 256; ++i)
    {
        const Rgb8 c = color::RgbForIndex(i);
        EXPECT_EQ(color::RgbForIndex(color::Nearest256(c)), c) << "index " << i;
    }
}

TEST(ColorMathTest, Nearest16StaysInAnsiRange)
{
    EXPECT_EQ(color::Nearest16(Rgb8{250, 10, 10}), 9);
    EXPECT_EQ(color::Nearest16(Rgb8{0, 0, 0}), 0);
    EXPECT_EQ(color::Nearest16(Rgb8{230, 230, 230}), 7);
    EXPECT_LT(color::Nearest16(Rgb8{95, 135, 175}), 16);
}

TEST(ColorMathTest, XtermPaletteLayout)
{
    EXPECT_EQ(xterm256::RgbForIndex(16).r, 0);
    EXPECT_EQ(xterm256::RgbForIndex(17).b, 95);
    EXPECT_EQ(xterm256::RgbForIndex(231).g, 255);
    EXPECT_EQ(xterm256::RgbForIndex(232).r, 8);
    EXPECT_EQ(xterm256::RgbForIndex(255).r, 238);
    EXPECT_EQ(xterm256::ClampIndex(-4), 0);
    EXPECT_EQ(xterm256::ClampIndex(999), 255);
}

TEST(ColorMathTest, ParseHexColor)
{
    EXPECT_EQ(color::ParseHexColor("ff8700"), (Rgb8{255, 135, 0}));
    EXPECT_EQ(color::ParseHexColor("#FF8700"), (Rgb8{255, 135, 0}));
    EXPECT_EQ(color::ParseHexColor("#0a0B0c"), (Rgb8{10, 11, 12}));

    EXPECT_FALSE(color::ParseHexColor("#GGHHII").has_value());
    EXPECT_FALSE(color::ParseHexColor("").has_value());
    EXPECT_FALSE(color::ParseHexColor("#").has_value());
    EXPECT_FALSE(color::ParseHexColor("#fff").has_value());
    EXPECT_FALSE(color::ParseHexColor("#1234567").has_value());
    EXPECT_FALSE(color::ParseHexColor("##123456").has_value());
}

TEST(ColorMathTest, ToHexIsUpperCase)
{
    EXPECT_EQ(color::ToHex(Rgb8{255, 135, 0}), "#FF8700");
    EXPECT_EQ(color::ToHex(Rgb8{0, 0, 0}), "#000000");
    EXPECT_EQ(color::ParseHexColor(color::ToHex(Rgb8{1, 2, 3})), (Rgb8{1, 2, 3}));
}

TEST(ColorMathTest, IndexNames)
{
    EXPECT_EQ(color::IndexName(0), "Black");
    EXPECT_EQ(color::IndexName(1), "Red");
    EXPECT_EQ(color::IndexName(15), "BrightWhite");
    EXPECT_EQ(color::IndexName(196), "#196");

    EXPECT_EQ(color::IndexFromLegacyName("Red"), std::optional<std::uint8_t>(1));
    EXPECT_EQ(color::IndexFromLegacyName("BrightCyan"), std::optional<std::uint8_t>(14));
    EXPECT_FALSE(color::IndexFromLegacyName("Teal").has_value());
}

TEST(ColorMathTest, DefaultPalette)
{
    const auto& pal = color::DefaultPalette();
    ASSERT_EQ(pal.size(), 24u);
    EXPECT_EQ(pal[0], (Rgb8{0, 0, 0}));
    EXPECT_EQ(pal[1], color::RgbForIndex(236));
    EXPECT_EQ(pal[5], (Rgb8{255, 255, 255}));
}

TEST(ColorMathTest, HueGroupsPartitionTheCube)
{
    const auto groups = color::BuildHueGroups();
    ASSERT_EQ(groups.size(), 8u);
    EXPECT_EQ(groups.front().name, "Reds");
    EXPECT_EQ(groups.back().name, "Pinks");

    std::set<int> seen;
    size_t total = 0;
    for (const auto& g : groups)
    {
        for (std::uint8_t idx : g.indices)
        {
            EXPECT_GE(idx, 16);
            EXPECT_LE(idx, 231);
            seen.insert(idx);
            ++total;
        }
    }
    EXPECT_EQ(total, 216u);
    EXPECT_EQ(seen.size(), 216u);
}
