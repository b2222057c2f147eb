#include "io/editor_config.h"

#include "core/color_math.h"
#include "core/paths.h"
#include "io/file_util.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

static constexpr int kConfigSchemaVersion = 1;

std::string GetEditorConfigPath()
{
    return KakuConfigPath("config.json");
}

static json ToJson(const EditorConfig& cfg)
{
    json j;
    j["schema_version"] = kConfigSchemaVersion;
    j["default_width"] = cfg.default_width;
    j["default_height"] = cfg.default_height;
    j["default_fg"] = kaku::color::ToHex(cfg.default_fg);
    j["symmetry"] = std::string(kaku::SymmetryName(cfg.symmetry));
    j["filled_rect"] = cfg.filled_rect;
    j["export_color_mode"] = std::string(formats::ansi::ColorModeName(cfg.export_color_mode));
    j["autosave_interval_sec"] = cfg.autosave_interval_sec;
    return j;
}

static void FromJson(const json& j, EditorConfig& out)
{
    // Defaults are already in out; only override what we recognize.
    if (j.contains("default_width") && j["default_width"].is_number_integer())
        out.default_width = kaku::Grid::ClampDimension(j["default_width"].get<int>());
    if (j.contains("default_height") && j["default_height"].is_number_integer())
        out.default_height = kaku::Grid::ClampDimension(j["default_height"].get<int>());

    if (j.contains("default_fg") && j["default_fg"].is_string())
    {
        if (const auto c = kaku::color::ParseHexColor(j["default_fg"].get<std::string>()))
            out.default_fg = *c;
        else
            std::fprintf(stderr, "[config] ignoring invalid default_fg\n");
    }

    if (j.contains("symmetry") && j["symmetry"].is_string())
    {
        if (const auto m = kaku::SymmetryFromName(j["symmetry"].get<std::string>()))
            out.symmetry = *m;
        else
            std::fprintf(stderr, "[config] ignoring unknown symmetry mode\n");
    }

    if (j.contains("filled_rect") && j["filled_rect"].is_boolean())
        out.filled_rect = j["filled_rect"].get<bool>();

    if (j.contains("export_color_mode") && j["export_color_mode"].is_string())
    {
        if (const auto m = formats::ansi::ColorModeFromName(j["export_color_mode"].get<std::string>()))
            out.export_color_mode = *m;
        else
            std::fprintf(stderr, "[config] ignoring unknown export_color_mode\n");
    }

    if (j.contains("autosave_interval_sec") && j["autosave_interval_sec"].is_number_integer())
    {
        const int v = j["autosave_interval_sec"].get<int>();
        out.autosave_interval_sec = (v > 0) ? v : 0;
    }
}

bool LoadEditorConfigFromFile(const std::string& path, EditorConfig& out, std::string& err)
{
    err.clear();

    std::ifstream f(path);
    if (!f)
    {
        std::error_code ec;
        const bool exists = fs::exists(path, ec);
        if (exists && !ec)
        {
            err = std::string("Failed to open config file for reading: ") + path;
            return false;
        }
        return true; // first run; keep defaults
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse config (") + path + "): " + e.what();
        return false;
    }

    if (!j.is_object())
    {
        err = std::string("Config root is not an object: ") + path;
        return false;
    }

    if (j.contains("schema_version") && j["schema_version"].is_number_integer())
    {
        const int ver = j["schema_version"].get<int>();
        if (ver != kConfigSchemaVersion)
        {
            // Unknown schema: ignore file rather than failing startup.
            std::fprintf(stderr, "[config] %s: unknown schema_version %d, using defaults\n", path.c_str(), ver);
            return true;
        }
    }

    FromJson(j, out);
    return true;
}

bool SaveEditorConfigToFile(const std::string& path, const EditorConfig& cfg, std::string& err)
{
    err.clear();

    std::string werr;
    if (!file_util::WriteTextAtomic(path, ToJson(cfg).dump(2) + "\n", werr))
    {
        err = std::string("Failed to save config (") + path + "): " + werr;
        return false;
    }
    return true;
}

bool LoadEditorConfig(EditorConfig& out, std::string& err)
{
    return LoadEditorConfigFromFile(GetEditorConfigPath(), out, err);
}

bool SaveEditorConfig(const EditorConfig& cfg, std::string& err)
{
    return SaveEditorConfigToFile(GetEditorConfigPath(), cfg, err);
}
