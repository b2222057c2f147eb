#include "core/paths.h"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string GetKakuConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return (fs::path(xdg) / "kaku").string();

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return (fs::path(home) / ".config" / "kaku").string();

    return ".";
}

std::string KakuConfigPath(const std::string& relative)
{
    if (relative.empty())
        return GetKakuConfigDir();
    return (fs::path(GetKakuConfigDir()) / relative).string();
}

