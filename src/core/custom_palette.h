#pragma once

#include "core/cell.h"
#include "core/color_math.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace kaku
{
// A user-curated, named colour list. Colours keep insertion order and never repeat.
struct CustomPalette
{
    static constexpr size_t kMaxColors = 256;

    std::string       name;
    std::vector<Rgb8> colors;

    bool Contains(const Rgb8& c) const { return std::find(colors.begin(), colors.end(), c) != colors.end(); }

    // False when the colour is already present or the palette is full.
    bool AddColor(const Rgb8& c)
    {
        if (Contains(c) || colors.size() >= kMaxColors)
            return false;
        colors.push_back(c);
        return true;
    }
};
} // namespace kaku
