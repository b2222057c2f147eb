#pragma once

#include "core/custom_palette.h"

#include <string>
#include <vector>

// Custom palette files: one "<name>.palette" JSON document per palette,
//
//   { "name": "Forest", "colors": ["#005f00", "#008700"] }
//
// Older files that list xterm-256 indices instead of hex strings still load;
// the indices are converted to RGB.
namespace palette_file
{
inline constexpr const char* kPaletteExtension = ".palette";

// Usable as a file stem: non-empty, no path separators, not "." or "..".
bool IsValidPaletteName(const std::string& name);

// "<dir>/<name>.palette"
std::string PalettePathFor(const std::string& dir, const std::string& name);

// "*.palette" file names in dir, sorted. Missing/unreadable dir yields an empty list.
std::vector<std::string> ListPaletteFiles(const std::string& dir);

bool LoadPaletteFromFile(const std::string& path, kaku::CustomPalette& out, std::string& err);
// Atomic (temp file + rename).
bool SavePaletteToFile(const std::string& path, const kaku::CustomPalette& palette, std::string& err);

// Operations on the palette named `name` inside `dir`.

// Writes a new empty palette. Fails if one with that name exists.
bool CreatePalette(const std::string& dir, const std::string& name, kaku::CustomPalette& out, std::string& err);

// Appends `c` and saves. `added` is false (and the file untouched) when the
// colour was already present or the palette is full.
bool AddColorToPalette(const std::string& dir, const std::string& name, const kaku::Rgb8& c, bool& added,
                       std::string& err);

// Refuses to overwrite an existing palette called new_name.
bool RenamePalette(const std::string& dir, const std::string& old_name, const std::string& new_name,
                   std::string& err);

// Saves a copy named "<name> (Copy)"; out_name receives the new name.
bool DuplicatePalette(const std::string& dir, const std::string& name, std::string& out_name, std::string& err);

bool DeletePalette(const std::string& dir, const std::string& name, std::string& err);

// Writes the palette to an arbitrary path, e.g. to share it.
bool ExportPalette(const std::string& dir, const std::string& name, const std::string& dest_path,
                   std::string& err);
} // namespace palette_file
