#include "core/grid.h"

#include <gtest/gtest.h>

#include <optional>

using namespace kaku;

namespace
{
Cell Painted(Rgb8 fg)
{
    return Cell{glyph::kFull, fg, std::nullopt};
}
} // namespace

TEST(GridTest, DefaultsTo32x32OfDefaultCells)
{
    const Grid g;
    EXPECT_EQ(g.Width(), 32);
    EXPECT_EQ(g.Height(), 32);
    ASSERT_EQ(g.Cells().size(), 32u * 32u);
    for (const Cell& c : g.Cells())
        EXPECT_EQ(c, DefaultCell());
    EXPECT_EQ(g.CountNonEmpty(), 0);
}

TEST(GridTest, DimensionsAreClamped)
{
    const Grid small(1, 0);
    EXPECT_EQ(small.Width(), Grid::kMinDimension);
    EXPECT_EQ(small.Height(), Grid::kMinDimension);

    const Grid big(500, 129);
    EXPECT_EQ(big.Width(), Grid::kMaxDimension);
    EXPECT_EQ(big.Height(), Grid::kMaxDimension);

    const Grid odd(17, 9);
    EXPECT_EQ(odd.Width(), 17);
    EXPECT_EQ(odd.Height(), 9);
}

TEST(GridTest, SetGetRoundTrip)
{
    Grid g(16, 8);
    const Cell c = Painted(Rgb8{1, 2, 3});
    g.Set(15, 7, c);
    EXPECT_EQ(g.Get(15, 7), std::optional<Cell>(c));
    EXPECT_EQ(g.Get(0, 0), std::optional<Cell>(DefaultCell()));
    EXPECT_EQ(g.CountNonEmpty(), 1);
    // Row-major storage.
    EXPECT_EQ(g.Cells()[7 * 16 + 15], c);
}

TEST(GridTest, OutOfRangeAccessIsHarmless)
{
    Grid g(8, 8);
    EXPECT_FALSE(g.Get(-1, 0).has_value());
    EXPECT_FALSE(g.Get(0, -1).has_value());
    EXPECT_FALSE(g.Get(8, 0).has_value());
    EXPECT_FALSE(g.Get(0, 8).has_value());

    const Grid before = g;
    g.Set(8, 8, Painted(Rgb8{9, 9, 9}));
    g.Set(-3, 2, Painted(Rgb8{9, 9, 9}));
    EXPECT_EQ(g, before);
}

TEST(GridTest, ResizeKeepsOverlap)
{
    Grid g(16, 16);
    const Cell a = Painted(Rgb8{10, 0, 0});
    const Cell b = Painted(Rgb8{0, 10, 0});
    g.Set(2, 3, a);
    g.Set(15, 15, b);

    g.Resize(10, 20);
    EXPECT_EQ(g.Width(), 10);
    EXPECT_EQ(g.Height(), 20);
    EXPECT_EQ(g.Get(2, 3), std::optional<Cell>(a));
    EXPECT_EQ(g.Get(9, 19), std::optional<Cell>(DefaultCell()));
    EXPECT_EQ(g.CountNonEmpty(), 1);

    g.Resize(16, 16);
    EXPECT_EQ(g.Get(15, 15), std::optional<Cell>(DefaultCell()));
}

TEST(GridTest, ResizeClamps)
{
    Grid g;
    g.Resize(2, 1000);
    EXPECT_EQ(g.Width(), Grid::kMinDimension);
    EXPECT_EQ(g.Height(), Grid::kMaxDimension);
}

TEST(GridTest, Clear)
{
    Grid g;
    g.Set(4, 4, Painted(Rgb8{1, 1, 1}));
    g.Clear();
    EXPECT_EQ(g, Grid());
}
