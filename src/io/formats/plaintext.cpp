#include "io/formats/plaintext.h"

#include "core/cell.h"
#include "core/glyph.h"

#include <cstddef>
#include <cstdio>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace formats
{
namespace plaintext
{
std::string ExportGridToString(const kaku::Grid& grid)
{
    std::vector<std::string> rows;
    rows.reserve((size_t)grid.Height());
    for (int y = 0; y < grid.Height(); ++y)
    {
        std::string row;
        for (int x = 0; x < grid.Width(); ++x)
        {
            const std::string g = kaku::glyph::ToUtf8(kaku::DisplayForm(*grid.Get(x, y)).glyph);
            row += g;
            row += g;
        }
        while (!row.empty() && row.back() == ' ')
            row.pop_back();
        rows.push_back(std::move(row));
    }

    while (!rows.empty() && rows.back().empty())
        rows.pop_back();

    std::string out;
    for (size_t i = 0; i < rows.size(); ++i)
    {
        if (i > 0)
            out.push_back('\n');
        out += rows[i];
    }
    return out;
}

bool ExportGridToFile(const std::string& path, const kaku::Grid& grid, std::string& err)
{
    err.clear();
    const std::string text = ExportGridToString(grid);

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
    std::fprintf(stderr, "[export] wrote %s (text)\n", path.c_str());
    return true;
}
} // namespace plaintext
} // namespace formats
