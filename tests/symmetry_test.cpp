#include "core/symmetry.h"

#include <gtest/gtest.h>

#include <optional>
#include <set>
#include <utility>
#include <vector>

using namespace kaku;

namespace
{
CellMutation At(int x, int y)
{
    return CellMutation{x, y, DefaultCell(), Cell{glyph::kFull, Rgb8{255, 0, 0}, std::nullopt}};
}

std::vector<std::pair<int, int>> Positions(const std::vector<CellMutation>& muts)
{
    std::vector<std::pair<int, int>> out;
    for (const auto& m : muts)
        out.emplace_back(m.x, m.y);
    return out;
}
} // namespace

TEST(SymmetryTest, OffIsIdentity)
{
    const auto out = ApplySymmetry({At(5, 10)}, SymmetryMode::Off, 32, 32);
    EXPECT_EQ(Positions(out), (std::vector<std::pair<int, int>>{{5, 10}}));
}

TEST(SymmetryTest, QuadProducesFourInOrder)
{
    const auto out = ApplySymmetry({At(5, 10)}, SymmetryMode::Quad, 32, 32);
    EXPECT_EQ(Positions(out), (std::vector<std::pair<int, int>>{{5, 10}, {26, 10}, {5, 21}, {26, 21}}));
    for (const auto& m : out)
        EXPECT_EQ(m.next, out[0].next);
}

TEST(SymmetryTest, HorizontalAndVertical)
{
    EXPECT_EQ(Positions(ApplySymmetry({At(0, 3)}, SymmetryMode::Horizontal, 16, 8)),
              (std::vector<std::pair<int, int>>{{0, 3}, {15, 3}}));
    EXPECT_EQ(Positions(ApplySymmetry({At(0, 3)}, SymmetryMode::Vertical, 16, 8)),
              (std::vector<std::pair<int, int>>{{0, 3}, {0, 4}}));
}

TEST(SymmetryTest, OnAxisPointsAreNotDuplicated)
{
    // Odd sizes have a center row/column that mirrors onto itself.
    EXPECT_EQ(ApplySymmetry({At(16, 4)}, SymmetryMode::Horizontal, 33, 9).size(), 1u);
    EXPECT_EQ(ApplySymmetry({At(2, 4)}, SymmetryMode::Vertical, 33, 9).size(), 1u);

    const auto quad_center = ApplySymmetry({At(16, 4)}, SymmetryMode::Quad, 33, 9);
    EXPECT_EQ(quad_center.size(), 1u);

    const auto quad_row = ApplySymmetry({At(2, 4)}, SymmetryMode::Quad, 33, 9);
    EXPECT_EQ(Positions(quad_row), (std::vector<std::pair<int, int>>{{2, 4}, {30, 4}}));

    std::set<std::pair<int, int>> unique;
    for (const auto& p : Positions(ApplySymmetry({At(16, 0)}, SymmetryMode::Quad, 33, 9)))
        EXPECT_TRUE(unique.insert(p).second);
}

TEST(SymmetryTest, Toggles)
{
    EXPECT_EQ(ToggleHorizontal(SymmetryMode::Off), SymmetryMode::Horizontal);
    EXPECT_EQ(ToggleHorizontal(SymmetryMode::Horizontal), SymmetryMode::Off);
    EXPECT_EQ(ToggleHorizontal(SymmetryMode::Vertical), SymmetryMode::Quad);
    EXPECT_EQ(ToggleHorizontal(SymmetryMode::Quad), SymmetryMode::Vertical);

    EXPECT_EQ(ToggleVertical(SymmetryMode::Off), SymmetryMode::Vertical);
    EXPECT_EQ(ToggleVertical(SymmetryMode::Vertical), SymmetryMode::Off);
    EXPECT_EQ(ToggleVertical(SymmetryMode::Horizontal), SymmetryMode::Quad);
    EXPECT_EQ(ToggleVertical(SymmetryMode::Quad), SymmetryMode::Horizontal);
}

TEST(SymmetryTest, Names)
{
    for (SymmetryMode m : {SymmetryMode::Off, SymmetryMode::Horizontal, SymmetryMode::Vertical, SymmetryMode::Quad})
        EXPECT_EQ(SymmetryFromName(SymmetryName(m)), std::optional<SymmetryMode>(m));
    EXPECT_EQ(SymmetryLabel(SymmetryMode::Horizontal), "Horiz");
    EXPECT_FALSE(SymmetryFromName("Diagonal").has_value());
}
