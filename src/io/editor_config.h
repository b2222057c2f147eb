#pragma once

#include "core/cell.h"
#include "core/symmetry.h"
#include "io/formats/ansi.h"

#include <string>

// Small persistent editor preferences:
// - canvas size used for new projects
// - default brush colour, symmetry mode and rectangle fill
// - export colour mode and autosave interval
struct EditorConfig
{
    int default_width = kaku::Grid::kDefaultWidth;
    int default_height = kaku::Grid::kDefaultHeight;

    kaku::Rgb8         default_fg = kaku::kDefaultFg;
    kaku::SymmetryMode symmetry = kaku::SymmetryMode::Off;
    bool               filled_rect = false;

    formats::ansi::ExportOptions::ColorMode export_color_mode = formats::ansi::ExportOptions::ColorMode::TrueColor;

    // 0 disables autosave.
    int autosave_interval_sec = 60;
};

// "<config_dir>/config.json"
std::string GetEditorConfigPath();

// Loads from GetEditorConfigPath(). A missing file, or one with an unknown
// schema_version, leaves `out` at its defaults and returns true.
bool LoadEditorConfig(EditorConfig& out, std::string& err);
bool SaveEditorConfig(const EditorConfig& cfg, std::string& err);

// Path-explicit variants (used by tests and --config).
bool LoadEditorConfigFromFile(const std::string& path, EditorConfig& out, std::string& err);
bool SaveEditorConfigToFile(const std::string& path, const EditorConfig& cfg, std::string& err);
