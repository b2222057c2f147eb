#pragma once

#include "core/grid.h"

#include <optional>
#include <string>
#include <string_view>

// ANSI art export: UTF-8 block glyphs with SGR colour escapes, for terminals.
namespace formats
{
namespace ansi
{
struct ExportOptions
{
    // How colors are emitted.
    enum class ColorMode
    {
        // Classic 16-color SGR (30-37/90-97, 40-47/100-107), nearest of xterm 0..15.
        Ansi16 = 0,
        // Indexed 256-color SGR (38;5;n / 48;5;n), nearest xterm index.
        Xterm256,
        // 24-bit SGR (38;2;r;g;b / 48;2;r;g;b).
        TrueColor,
    };
    ColorMode color_mode = ColorMode::TrueColor;

    // Each cell is written twice so pixels come out roughly square.
    bool double_width = true;

    // Append '\n' after the last row.
    bool final_newline = false;
};

// "truecolor" | "256" | "16"
std::optional<ExportOptions::ColorMode> ColorModeFromName(std::string_view name);
std::string_view ColorModeName(ExportOptions::ColorMode mode);

// Rows are joined by '\n'. Every row ends with ESC[0m; SGR is only emitted when the
// colour state changes. Trailing rows without visible content are dropped.
std::string ExportGridToString(const kaku::Grid& grid, const ExportOptions& options = {});

// Convenience wrapper that exports and writes to disk.
bool ExportGridToFile(const std::string& path,
                      const kaku::Grid& grid,
                      std::string& err,
                      const ExportOptions& options = {});
} // namespace ansi
} // namespace formats
