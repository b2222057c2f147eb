#pragma once

#include <string>

// Returns the per-user config directory used by kaku.
//
// $XDG_CONFIG_HOME/kaku, else $HOME/.config/kaku, else "." as a last resort.
std::string GetKakuConfigDir();

// Joins the config dir and a relative path within it.
// Example: KakuConfigPath("config.json") -> "<config_dir>/config.json"
std::string KakuConfigPath(const std::string& relative);

