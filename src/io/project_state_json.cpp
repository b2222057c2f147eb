#include "io/project_state_json.h"

#include "core/color_math.h"
#include "core/glyph.h"

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace project_state_json
{
using kaku::Cell;
using kaku::Grid;
using kaku::ProjectState;
using kaku::Rgb8;

static json ColorToJson(const std::optional<Rgb8>& c)
{
    if (!c)
        return nullptr;
    return kaku::color::ToHex(*c);
}

// Colours are "#RRGGBB" strings or null (transparent). Legacy documents store
// xterm indices, either as integers or as the 16 standard names ("Red").
static bool ColorFromJson(const json& j, std::optional<Rgb8>& out, std::string& err)
{
    if (j.is_null())
    {
        out.reset();
        return true;
    }
    if (j.is_number_integer())
    {
        const std::int64_t idx = j.get<std::int64_t>();
        if (idx < 0 || idx > 255)
        {
            err = "Colour index out of range: " + std::to_string(idx);
            return false;
        }
        out = kaku::color::RgbForIndex((int)idx);
        return true;
    }
    if (j.is_string())
    {
        const std::string s = j.get<std::string>();
        if (const std::optional<Rgb8> rgb = kaku::color::ParseHexColor(s))
        {
            out = *rgb;
            return true;
        }
        if (const std::optional<std::uint8_t> idx = kaku::color::IndexFromLegacyName(s))
        {
            out = kaku::color::RgbForIndex(*idx);
            return true;
        }
        err = "Unrecognized colour: '" + s + "'";
        return false;
    }
    err = "Colour must be a string, integer or null.";
    return false;
}

static bool ReadDimension(const json& canvas, const char* key, int& out, std::string& err)
{
    out = (std::string_view(key) == "width") ? Grid::kDefaultWidth : Grid::kDefaultHeight;
    if (!canvas.contains(key))
        return true;
    const json& v = canvas[key];
    if (!v.is_number_integer())
    {
        err = std::string("canvas.") + key + " is not an integer.";
        return false;
    }
    out = Grid::ClampDimension(v.get<int>());
    return true;
}

static json GridToJson(const Grid& g)
{
    json jc;
    jc["width"] = g.Width();
    jc["height"] = g.Height();

    json rows = json::array();
    for (int y = 0; y < g.Height(); ++y)
    {
        json row = json::array();
        for (int x = 0; x < g.Width(); ++x)
            row.push_back(CellToJson(*g.Get(x, y)));
        rows.push_back(std::move(row));
    }
    jc["cells"] = std::move(rows);
    return jc;
}

static bool GridFromJson(const json& jc, Grid& out, std::string& err)
{
    if (!jc.is_object())
    {
        err = "canvas is not an object.";
        return false;
    }

    int w = 0;
    int h = 0;
    if (!ReadDimension(jc, "width", w, err) || !ReadDimension(jc, "height", h, err))
        return false;

    Grid g(w, h);
    if (jc.contains("cells"))
    {
        const json& rows = jc["cells"];
        if (!rows.is_array())
        {
            err = "canvas.cells is not an array.";
            return false;
        }
        // Rows/columns beyond the declared size are ignored; missing ones stay default.
        int y = 0;
        for (const json& row : rows)
        {
            if (y >= g.Height())
                break;
            if (!row.is_array())
            {
                err = "canvas.cells row " + std::to_string(y) + " is not an array.";
                return false;
            }
            int x = 0;
            for (const json& jcell : row)
            {
                if (x >= g.Width())
                    break;
                Cell c;
                std::string cerr;
                if (!CellFromJson(jcell, c, cerr))
                {
                    err = "canvas.cells[" + std::to_string(y) + "][" + std::to_string(x) + "]: " + cerr;
                    return false;
                }
                g.Set(x, y, c);
                ++x;
            }
            ++y;
        }
    }

    out = std::move(g);
    return true;
}

json CellToJson(const Cell& c)
{
    json j;
    j["glyph"] = std::string(kaku::glyph::Name(c.glyph));
    j["fg"] = ColorToJson(c.fg);
    j["bg"] = ColorToJson(c.bg);
    return j;
}

bool CellFromJson(const json& j, Cell& out, std::string& err)
{
    err.clear();
    if (!j.is_object())
    {
        err = "cell is not an object.";
        return false;
    }

    Cell c;
    // Legacy documents use "block".
    const char* glyph_key = j.contains("glyph") ? "glyph" : (j.contains("block") ? "block" : nullptr);
    if (glyph_key)
    {
        const json& g = j[glyph_key];
        if (!g.is_string())
        {
            err = std::string(glyph_key) + " is not a string.";
            return false;
        }
        // Unknown names (written by a newer version) read as Full.
        c.glyph = kaku::glyph::FromName(g.get<std::string>()).value_or(kaku::glyph::kFull);
    }

    if (j.contains("fg") && !ColorFromJson(j["fg"], c.fg, err))
        return false;
    if (j.contains("bg") && !ColorFromJson(j["bg"], c.bg, err))
        return false;

    out = c;
    return true;
}

json ToJson(const ProjectState& st)
{
    json j;
    j["version"] = ProjectState::kCurrentVersion;
    j["name"] = st.name;
    j["created_at"] = st.created_at;
    j["modified_at"] = st.modified_at;
    j["color"] = kaku::color::ToHex(st.color);
    j["symmetry"] = std::string(kaku::SymmetryName(st.symmetry));
    j["canvas"] = GridToJson(st.grid);
    return j;
}

bool FromJson(const json& j, ProjectState& out, std::string& err)
{
    err.clear();
    try
    {
        if (!j.is_object())
        {
            err = "Project file root is not an object.";
            return false;
        }

        ProjectState st;
        if (!j.contains("version") || !j["version"].is_number_integer())
        {
            err = "Project missing integer 'version'.";
            return false;
        }
        st.version = j["version"].get<int>();
        if (st.version < 1)
        {
            err = "Invalid project version " + std::to_string(st.version) + ".";
            return false;
        }
        if (st.version > ProjectState::kCurrentVersion)
        {
            err = "File version " + std::to_string(st.version) + " is newer than supported (v" +
                  std::to_string(ProjectState::kCurrentVersion) + ").";
            return false;
        }

        if (j.contains("name") && j["name"].is_string())
            st.name = j["name"].get<std::string>();
        if (j.contains("created_at") && j["created_at"].is_string())
            st.created_at = j["created_at"].get<std::string>();
        if (j.contains("modified_at") && j["modified_at"].is_string())
            st.modified_at = j["modified_at"].get<std::string>();

        if (j.contains("color"))
        {
            std::optional<Rgb8> c;
            if (!ColorFromJson(j["color"], c, err))
            {
                err = "color: " + err;
                return false;
            }
            if (c)
                st.color = *c;
        }

        if (j.contains("symmetry") && j["symmetry"].is_string())
        {
            const std::string s = j["symmetry"].get<std::string>();
            const std::optional<kaku::SymmetryMode> m = kaku::SymmetryFromName(s);
            if (!m)
            {
                err = "Unknown symmetry mode '" + s + "'.";
                return false;
            }
            st.symmetry = *m;
        }

        if (!j.contains("canvas"))
        {
            err = "Project missing 'canvas'.";
            return false;
        }
        if (!GridFromJson(j["canvas"], st.grid, err))
            return false;

        out = std::move(st);
        return true;
    }
    catch (const std::exception& e)
    {
        err = std::string("Invalid project document: ") + e.what();
        return false;
    }
}
} // namespace project_state_json
