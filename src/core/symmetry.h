#pragma once

#include "core/history.h"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace kaku
{
// Horizontal mirrors across the vertical center line (x' = w-1-x),
// Vertical mirrors across the horizontal center line (y' = h-1-y), Quad does both.
enum class SymmetryMode : std::uint8_t
{
    Off = 0,
    Horizontal,
    Vertical,
    Quad,
};

constexpr bool HasHorizontal(SymmetryMode m) { return m == SymmetryMode::Horizontal || m == SymmetryMode::Quad; }
constexpr bool HasVertical(SymmetryMode m) { return m == SymmetryMode::Vertical || m == SymmetryMode::Quad; }

// Independent bit flips over the four-state mode.
SymmetryMode ToggleHorizontal(SymmetryMode m);
SymmetryMode ToggleVertical(SymmetryMode m);

// Short status-bar label ("Off", "Horiz", "Vert", "Quad").
std::string_view SymmetryLabel(SymmetryMode m);

// Stable persistence name ("Off", "Horizontal", "Vertical", "Quad").
std::string_view SymmetryName(SymmetryMode m);
std::optional<SymmetryMode> SymmetryFromName(std::string_view name);

// Expands each mutation into itself plus its mirrors, in the order
// original, horizontal, vertical, diagonal. A mirror that lands on the original
// coordinate is skipped; the diagonal is added only when both mirrored
// coordinates differ from the original.
//
// Mirrored copies carry the origin's `old`/`next`; `old` is stale for the mirrored
// position and must be re-read from the grid before applying.
std::vector<CellMutation> ApplySymmetry(const std::vector<CellMutation>& mutations,
                                        SymmetryMode mode,
                                        int width,
                                        int height);
} // namespace kaku
