#include "core/symmetry.h"

namespace kaku
{
SymmetryMode ToggleHorizontal(SymmetryMode m)
{
    switch (m)
    {
        case SymmetryMode::Off: return SymmetryMode::Horizontal;
        case SymmetryMode::Horizontal: return SymmetryMode::Off;
        case SymmetryMode::Vertical: return SymmetryMode::Quad;
        case SymmetryMode::Quad: return SymmetryMode::Vertical;
    }
    return SymmetryMode::Off;
}

SymmetryMode ToggleVertical(SymmetryMode m)
{
    switch (m)
    {
        case SymmetryMode::Off: return SymmetryMode::Vertical;
        case SymmetryMode::Vertical: return SymmetryMode::Off;
        case SymmetryMode::Horizontal: return SymmetryMode::Quad;
        case SymmetryMode::Quad: return SymmetryMode::Horizontal;
    }
    return SymmetryMode::Off;
}

std::string_view SymmetryLabel(SymmetryMode m)
{
    switch (m)
    {
        case SymmetryMode::Off: return "Off";
        case SymmetryMode::Horizontal: return "Horiz";
        case SymmetryMode::Vertical: return "Vert";
        case SymmetryMode::Quad: return "Quad";
    }
    return "Off";
}

std::string_view SymmetryName(SymmetryMode m)
{
    switch (m)
    {
        case SymmetryMode::Off: return "Off";
        case SymmetryMode::Horizontal: return "Horizontal";
        case SymmetryMode::Vertical: return "Vertical";
        case SymmetryMode::Quad: return "Quad";
    }
    return "Off";
}

std::optional<SymmetryMode> SymmetryFromName(std::string_view name)
{
    if (name == "Off") return SymmetryMode::Off;
    if (name == "Horizontal") return SymmetryMode::Horizontal;
    if (name == "Vertical") return SymmetryMode::Vertical;
    if (name == "Quad") return SymmetryMode::Quad;
    return std::nullopt;
}

std::vector<CellMutation> ApplySymmetry(const std::vector<CellMutation>& mutations,
                                        SymmetryMode mode,
                                        int width,
                                        int height)
{
    if (mode == SymmetryMode::Off)
        return mutations;

    std::vector<CellMutation> out;
    out.reserve(mutations.size() * 4);

    for (const CellMutation& m : mutations)
    {
        out.push_back(m);

        const int mx = width - 1 - m.x;
        const int my = height - 1 - m.y;

        if (HasHorizontal(mode) && mx != m.x)
        {
            CellMutation h = m;
            h.x = mx;
            out.push_back(h);
        }

        if (HasVertical(mode) && my != m.y)
        {
            CellMutation v = m;
            v.y = my;
            out.push_back(v);
        }

        if (mode == SymmetryMode::Quad && mx != m.x && my != m.y)
        {
            CellMutation d = m;
            d.x = mx;
            d.y = my;
            out.push_back(d);
        }
    }
    return out;
}
} // namespace kaku
