#include "io/formats/ansi.h"

#include "core/cell.h"
#include "core/color_math.h"
#include "core/glyph.h"

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <optional>
#include <string>

namespace formats
{
namespace ansi
{
using kaku::Rgb8;
using ColorMode = ExportOptions::ColorMode;

static constexpr char ESC = '\x1b';

static void EmitSgr(std::string& out, const std::string& params)
{
    out.push_back(ESC);
    out.push_back('[');
    out += params;
    out.push_back('m');
}

// One SGR parameter group for a foreground (is_bg=false) or background colour.
static std::string ColorParams(const std::optional<Rgb8>& c, bool is_bg, ColorMode mode)
{
    if (!c)
        return is_bg ? "49" : "39";

    switch (mode)
    {
        case ColorMode::TrueColor:
            return std::string(is_bg ? "48;2;" : "38;2;") + std::to_string(c->r) + ";" + std::to_string(c->g) + ";" +
                   std::to_string(c->b);
        case ColorMode::Xterm256:
            return std::string(is_bg ? "48;5;" : "38;5;") + std::to_string(kaku::color::Nearest256(*c));
        case ColorMode::Ansi16:
        {
            const int idx = kaku::color::Nearest16(*c);
            const int base = (idx < 8) ? (is_bg ? 40 : 30) : (is_bg ? 100 : 90);
            return std::to_string(base + (idx & 7));
        }
    }
    return is_bg ? "49" : "39";
}

// A row is visible if any cell draws a glyph or paints a background.
static bool RowHasContent(const kaku::Grid& grid, int y)
{
    for (int x = 0; x < grid.Width(); ++x)
    {
        const kaku::ResolvedCell d = kaku::DisplayForm(*grid.Get(x, y));
        if (d.glyph != kaku::glyph::kEmpty || d.bg)
            return true;
    }
    return false;
}

std::optional<ColorMode> ColorModeFromName(std::string_view name)
{
    if (name == "truecolor" || name == "24bit") return ColorMode::TrueColor;
    if (name == "256" || name == "xterm256") return ColorMode::Xterm256;
    if (name == "16" || name == "ansi16") return ColorMode::Ansi16;
    return std::nullopt;
}

std::string_view ColorModeName(ColorMode mode)
{
    switch (mode)
    {
        case ColorMode::TrueColor: return "truecolor";
        case ColorMode::Xterm256: return "256";
        case ColorMode::Ansi16: return "16";
    }
    return "truecolor";
}

std::string ExportGridToString(const kaku::Grid& grid, const ExportOptions& options)
{
    int last_row = -1;
    for (int y = grid.Height() - 1; y >= 0; --y)
    {
        if (RowHasContent(grid, y))
        {
            last_row = y;
            break;
        }
    }

    std::string out;
    for (int y = 0; y <= last_row; ++y)
    {
        // Colour state is reset at the end of every row, so it starts unknown.
        bool have_state = false;
        std::optional<Rgb8> cur_fg;
        std::optional<Rgb8> cur_bg;

        for (int x = 0; x < grid.Width(); ++x)
        {
            const kaku::ResolvedCell d = kaku::DisplayForm(*grid.Get(x, y));
            if (!have_state || d.fg != cur_fg || d.bg != cur_bg)
            {
                EmitSgr(out, ColorParams(d.fg, false, options.color_mode) + ";" +
                                 ColorParams(d.bg, true, options.color_mode));
                cur_fg = d.fg;
                cur_bg = d.bg;
                have_state = true;
            }
            const std::string ch = kaku::glyph::ToUtf8(d.glyph);
            out += ch;
            if (options.double_width)
                out += ch;
        }
        EmitSgr(out, "0");
        if (y < last_row || options.final_newline)
            out.push_back('\n');
    }
    return out;
}

bool ExportGridToFile(const std::string& path,
                      const kaku::Grid& grid,
                      std::string& err,
                      const ExportOptions& options)
{
    err.clear();
    const std::string text = ExportGridToString(grid, options);

    std::ofstream out(path, std::ios::binary);
    if (!out)
    {
        err = "Failed to open file for writing: " + path;
        return false;
    }
    out.write(text.data(), (std::streamsize)text.size());
    if (!out)
    {
        err = "Failed to write file contents.";
        return false;
    }
    std::fprintf(stderr, "[export] wrote %s (ansi, %s)\n", path.c_str(),
                 std::string(ColorModeName(options.color_mode)).c_str());
    return true;
}
} // namespace ansi
} // namespace formats
