#include "io/palette_file.h"

#include "io/file_util.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

namespace palette_file
{
namespace
{
namespace fs = std::filesystem;
using json = nlohmann::json;

// Hex string, or an xterm-256 index from older files.
static std::optional<kaku::Rgb8> ColorFromJson(const json& v)
{
    if (v.is_string())
        return kaku::color::ParseHexColor(v.get<std::string>());
    if (v.is_number_integer())
    {
        const int idx = v.get<int>();
        if (idx >= 0 && idx <= 255)
            return kaku::color::RgbForIndex(idx);
    }
    return std::nullopt;
}

static json ToJson(const kaku::CustomPalette& palette)
{
    json j;
    j["name"] = palette.name;
    json colors = json::array();
    for (const kaku::Rgb8& c : palette.colors)
        colors.push_back(kaku::color::ToHex(c));
    j["colors"] = std::move(colors);
    return j;
}

static bool FromJson(const json& j, kaku::CustomPalette& out, std::string& err)
{
    if (!j.is_object())
    {
        err = "Palette root is not an object.";
        return false;
    }
    if (!j.contains("name") || !j["name"].is_string())
    {
        err = "Palette has no name.";
        return false;
    }

    kaku::CustomPalette p;
    p.name = j["name"].get<std::string>();
    if (j.contains("colors"))
    {
        if (!j["colors"].is_array())
        {
            err = "Palette 'colors' is not an array.";
            return false;
        }
        size_t skipped = 0;
        for (const json& v : j["colors"])
        {
            const std::optional<kaku::Rgb8> c = ColorFromJson(v);
            if (!c)
            {
                ++skipped;
                continue;
            }
            p.AddColor(*c);
        }
        if (skipped > 0)
            std::fprintf(stderr, "[palette] %s: skipped %zu invalid colour(s)\n", p.name.c_str(), skipped);
    }
    out = std::move(p);
    return true;
}

static bool Exists(const std::string& path)
{
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

static bool CheckName(const std::string& name, std::string& err)
{
    if (IsValidPaletteName(name))
        return true;
    err = "Invalid palette name '" + name + "'.";
    return false;
}
} // namespace

bool IsValidPaletteName(const std::string& name)
{
    if (name.empty() || name == "." || name == "..")
        return false;
    return name.find_first_of("/\\") == std::string::npos;
}

std::string PalettePathFor(const std::string& dir, const std::string& name)
{
    return (fs::path(dir) / (name + kPaletteExtension)).string();
}

std::vector<std::string> ListPaletteFiles(const std::string& dir)
{
    std::vector<std::string> files;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        const fs::path& p = it->path();
        if (p.extension() == kPaletteExtension)
            files.push_back(p.filename().string());
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool LoadPaletteFromFile(const std::string& path, kaku::CustomPalette& out, std::string& err)
{
    err.clear();
    const std::vector<std::uint8_t> bytes = file_util::ReadAllBytes(path, err);
    if (!err.empty())
        return false;

    json j;
    try
    {
        j = json::parse(bytes.begin(), bytes.end());
    }
    catch (const std::exception& e)
    {
        err = std::string("Palette parse failed (") + path + "): " + e.what();
        return false;
    }
    return FromJson(j, out, err);
}

bool SavePaletteToFile(const std::string& path, const kaku::CustomPalette& palette, std::string& err)
{
    err.clear();
    return file_util::WriteTextAtomic(path, ToJson(palette).dump(2) + "\n", err);
}

bool CreatePalette(const std::string& dir, const std::string& name, kaku::CustomPalette& out, std::string& err)
{
    err.clear();
    if (!CheckName(name, err))
        return false;
    const std::string path = PalettePathFor(dir, name);
    if (Exists(path))
    {
        err = "Palette already exists: " + name;
        return false;
    }

    kaku::CustomPalette p;
    p.name = name;
    if (!SavePaletteToFile(path, p, err))
        return false;
    out = std::move(p);
    return true;
}

bool AddColorToPalette(const std::string& dir, const std::string& name, const kaku::Rgb8& c, bool& added,
                       std::string& err)
{
    err.clear();
    added = false;
    if (!CheckName(name, err))
        return false;

    const std::string path = PalettePathFor(dir, name);
    kaku::CustomPalette p;
    if (!LoadPaletteFromFile(path, p, err))
        return false;
    if (!p.AddColor(c))
        return true;
    if (!SavePaletteToFile(path, p, err))
        return false;
    added = true;
    return true;
}

bool RenamePalette(const std::string& dir, const std::string& old_name, const std::string& new_name,
                   std::string& err)
{
    err.clear();
    if (!CheckName(old_name, err) || !CheckName(new_name, err))
        return false;

    const std::string old_path = PalettePathFor(dir, old_name);
    const std::string new_path = PalettePathFor(dir, new_name);
    if (Exists(new_path))
    {
        err = "Palette already exists: " + new_name;
        return false;
    }

    kaku::CustomPalette p;
    if (!LoadPaletteFromFile(old_path, p, err))
        return false;
    p.name = new_name;
    if (!SavePaletteToFile(new_path, p, err))
        return false;

    std::error_code ec;
    fs::remove(old_path, ec);
    if (ec)
    {
        err = "Renamed, but failed to remove " + old_path + ": " + ec.message();
        return false;
    }
    return true;
}

bool DuplicatePalette(const std::string& dir, const std::string& name, std::string& out_name, std::string& err)
{
    err.clear();
    if (!CheckName(name, err))
        return false;

    kaku::CustomPalette p;
    if (!LoadPaletteFromFile(PalettePathFor(dir, name), p, err))
        return false;

    const std::string copy_name = name + " (Copy)";
    const std::string copy_path = PalettePathFor(dir, copy_name);
    if (Exists(copy_path))
    {
        err = "Palette already exists: " + copy_name;
        return false;
    }
    p.name = copy_name;
    if (!SavePaletteToFile(copy_path, p, err))
        return false;
    out_name = copy_name;
    return true;
}

bool DeletePalette(const std::string& dir, const std::string& name, std::string& err)
{
    err.clear();
    if (!CheckName(name, err))
        return false;

    const std::string path = PalettePathFor(dir, name);
    std::error_code ec;
    if (!fs::remove(path, ec))
    {
        err = ec ? ("Failed to delete " + path + ": " + ec.message()) : ("No such palette: " + name);
        return false;
    }
    return true;
}

bool ExportPalette(const std::string& dir, const std::string& name, const std::string& dest_path,
                   std::string& err)
{
    err.clear();
    if (!CheckName(name, err))
        return false;

    kaku::CustomPalette p;
    if (!LoadPaletteFromFile(PalettePathFor(dir, name), p, err))
        return false;
    return SavePaletteToFile(dest_path, p, err);
}
} // namespace palette_file
