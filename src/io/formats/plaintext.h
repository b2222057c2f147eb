#pragma once

#include "core/grid.h"

#include <string>

// Plaintext export: block glyphs and newlines only (no SGR, no cursor movement).
//
// Each cell's glyph is written twice (square pixels), trailing spaces are stripped
// per row and trailing empty rows are dropped.
namespace formats
{
namespace plaintext
{
std::string ExportGridToString(const kaku::Grid& grid);

bool ExportGridToFile(const std::string& path, const kaku::Grid& grid, std::string& err);
} // namespace plaintext
} // namespace formats
