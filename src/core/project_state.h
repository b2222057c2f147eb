#pragma once

#include "core/cell.h"
#include "core/grid.h"
#include "core/symmetry.h"

#include <string>

namespace kaku
{
// Everything a project file stores. Brush/tool state other than the active
// colour and symmetry mode is session-only.
struct ProjectState
{
    static constexpr int kCurrentVersion = 4;

    int         version = kCurrentVersion;
    std::string name;
    std::string created_at;  // ISO-8601 UTC, "YYYY-MM-DDTHH:MM:SSZ"
    std::string modified_at;
    Rgb8         color = kDefaultFg;
    SymmetryMode symmetry = SymmetryMode::Off;
    Grid         grid;
};
} // namespace kaku
