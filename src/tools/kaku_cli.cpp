// kaku: command-line front end for the drawing engine.
//
// Most commands are one-shot: load (or create) a project, do one thing, save.
// `session` keeps a project open and reads edit commands from stdin.
#include "core/color_math.h"
#include "core/edit_session.h"
#include "core/glyph.h"
#include "io/editor_config.h"
#include "io/formats/ansi.h"
#include "io/formats/plaintext.h"
#include "io/palette_file.h"
#include "io/project_file.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace
{
using kaku::Rgb8;

static constexpr int kExitOk = 0;
static constexpr int kExitError = 1;
static constexpr int kExitUsage = 2;

static void PrintUsage(const char* argv0)
{
    std::cerr
        << "Usage: " << argv0 << " [--config PATH] <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  new <file> [--size WxH] [--name NAME]\n"
        << "  info <file>\n"
        << "  export <file> [--format text|ansi] [--color truecolor|256|16] [--out PATH]\n"
        << "  draw <file> <tool> <x> <y> [<x2> <y2>] [--glyph NAME] [--fg HEX|none] [--bg HEX|none]\n"
        << "       [--symmetry Off|Horizontal|Vertical|Quad] [--filled] [--autosave]\n"
        << "       tools: pencil, eraser, line, rect, fill, pick\n"
        << "  session <file>           read edit commands from stdin (see below)\n"
        << "  recover <file>           replace <file> with <file>.autosave\n"
        << "  list <dir>\n"
        << "  color <hex>\n"
        << "  palette [--dir DIR] [list | show NAME | create NAME | add NAME HEX | rename OLD NEW\n"
        << "                       | duplicate NAME | delete NAME | export NAME DEST]\n"
        << "\n"
        << "Session commands, one per line:\n"
        << "  tool NAME | glyph NAME | fg HEX|none | bg HEX|none | symmetry MODE | filled on|off\n"
        << "  click X Y | begin | end | undo | redo | cancel | save | quit\n";
}

// Splits args into positionals and `--flag [value]` options for one command.
struct CommandArgs
{
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options; // value empty for switches
    std::string error;

    std::optional<std::string> Get(std::string_view key) const
    {
        for (const auto& [k, v] : options)
        {
            if (k == key)
                return v;
        }
        return std::nullopt;
    }
    bool Has(std::string_view key) const { return Get(key).has_value(); }
};

static bool IsSwitch(std::string_view flag)
{
    return flag == "--filled" || flag == "--autosave";
}

static CommandArgs ParseCommandArgs(int argc, char** argv, int first)
{
    CommandArgs out;
    for (int i = first; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        // Negative coordinates are positionals, not flags.
        if (a.size() > 2 && a.substr(0, 2) == "--")
        {
            if (IsSwitch(a))
            {
                out.options.emplace_back(std::string(a), std::string());
                continue;
            }
            if (i + 1 >= argc)
            {
                out.error = "Missing value for " + std::string(a);
                return out;
            }
            out.options.emplace_back(std::string(a), std::string(argv[++i]));
            continue;
        }
        out.positional.emplace_back(a);
    }
    return out;
}

static bool ParseInt(const std::string& s, int& out)
{
    try
    {
        size_t used = 0;
        const int v = std::stoi(s, &used);
        if (used != s.size())
            return false;
        out = v;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

static bool ParseSize(const std::string& s, int& w, int& h)
{
    const size_t x = s.find_first_of("xX");
    if (x == std::string::npos)
        return false;
    return ParseInt(s.substr(0, x), w) && ParseInt(s.substr(x + 1), h);
}

// "none" clears the colour; anything else must be hex.
static bool ParseColorArg(const std::string& s, std::optional<Rgb8>& out)
{
    if (s == "none")
    {
        out.reset();
        return true;
    }
    const std::optional<Rgb8> c = kaku::color::ParseHexColor(s);
    if (!c)
        return false;
    out = *c;
    return true;
}

static std::string ColorLabel(const std::optional<Rgb8>& c)
{
    return c ? kaku::color::ToHex(*c) : std::string("none");
}

static bool FileExists(const std::string& path)
{
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec;
}

// Saves the project and drops its now-stale autosave.
static bool SaveAndDiscardAutosave(const std::string& path, kaku::ProjectState& st)
{
    std::string err;
    if (!project_file::SaveProjectToFile(path, st, err))
    {
        std::cerr << "Failed to save " << path << ": " << err << "\n";
        return false;
    }
    if (!project_file::DiscardAutosave(path, err))
        std::fprintf(stderr, "[autosave] %s\n", err.c_str());
    return true;
}

static int CmdNew(const CommandArgs& args, const EditorConfig& cfg)
{
    if (args.positional.size() != 1)
        return kExitUsage;

    int w = cfg.default_width;
    int h = cfg.default_height;
    if (const auto size = args.Get("--size"))
    {
        if (!ParseSize(*size, w, h))
        {
            std::cerr << "Invalid --size '" << *size << "' (expected WxH)\n";
            return kExitUsage;
        }
    }

    const std::string& path = args.positional[0];
    kaku::ProjectState st = project_file::NewProjectState(args.Get("--name").value_or("untitled"), kaku::Grid(w, h));
    st.color = cfg.default_fg;
    st.symmetry = cfg.symmetry;

    std::string err;
    if (!project_file::SaveProjectToFile(path, st, err))
    {
        std::cerr << "Failed to save " << path << ": " << err << "\n";
        return kExitError;
    }
    std::cout << "Created " << path << " (" << st.grid.Width() << "x" << st.grid.Height() << ")\n";
    return kExitOk;
}

static int CmdInfo(const CommandArgs& args)
{
    if (args.positional.size() != 1)
        return kExitUsage;

    const std::string& path = args.positional[0];
    kaku::ProjectState st;
    std::string err;
    if (!project_file::LoadProjectFromFile(path, st, err))
    {
        std::cerr << "Failed to load " << path << ": " << err << "\n";
        return kExitError;
    }

    std::cout << "name:      " << st.name << "\n"
              << "version:   " << st.version << "\n"
              << "size:      " << st.grid.Width() << "x" << st.grid.Height() << "\n"
              << "created:   " << st.created_at << "\n"
              << "modified:  " << st.modified_at << "\n"
              << "color:     " << kaku::color::ToHex(st.color) << "\n"
              << "symmetry:  " << kaku::SymmetryName(st.symmetry) << "\n"
              << "non-empty: " << st.grid.CountNonEmpty() << "\n";
    return kExitOk;
}

static int CmdExport(const CommandArgs& args, const EditorConfig& cfg)
{
    if (args.positional.size() != 1)
        return kExitUsage;

    const std::string format = args.Get("--format").value_or("ansi");
    if (format != "ansi" && format != "text")
    {
        std::cerr << "Invalid --format '" << format << "' (expected text|ansi)\n";
        return kExitUsage;
    }

    formats::ansi::ExportOptions opt;
    opt.color_mode = cfg.export_color_mode;
    if (const auto mode = args.Get("--color"))
    {
        const auto m = formats::ansi::ColorModeFromName(*mode);
        if (!m)
        {
            std::cerr << "Invalid --color '" << *mode << "' (expected truecolor|256|16)\n";
            return kExitUsage;
        }
        opt.color_mode = *m;
    }

    const std::string& path = args.positional[0];
    kaku::ProjectState st;
    std::string err;
    if (!project_file::LoadProjectFromFile(path, st, err))
    {
        std::cerr << "Failed to load " << path << ": " << err << "\n";
        return kExitError;
    }

    if (const auto out_path = args.Get("--out"))
    {
        const bool ok = (format == "text") ? formats::plaintext::ExportGridToFile(*out_path, st.grid, err)
                                           : formats::ansi::ExportGridToFile(*out_path, st.grid, err, opt);
        if (!ok)
        {
            std::cerr << "Failed to export " << *out_path << ": " << err << "\n";
            return kExitError;
        }
        return kExitOk;
    }

    if (format == "text")
        std::cout << formats::plaintext::ExportGridToString(st.grid) << "\n";
    else
        std::cout << formats::ansi::ExportGridToString(st.grid, opt) << "\n";
    return kExitOk;
}

static int CmdDraw(const CommandArgs& args, const EditorConfig& cfg)
{
    const size_t n = args.positional.size();
    if (n != 4 && n != 6)
        return kExitUsage;

    const std::string& path = args.positional[0];
    const auto tool = kaku::tools::ToolFromName(args.positional[1]);
    if (!tool)
    {
        std::cerr << "Unknown tool '" << args.positional[1] << "'\n";
        return kExitUsage;
    }
    if (kaku::tools::IsTwoPointTool(*tool) != (n == 6))
    {
        std::cerr << kaku::tools::ToolName(*tool)
                  << (kaku::tools::IsTwoPointTool(*tool) ? " needs two points\n" : " takes a single point\n");
        return kExitUsage;
    }

    int coords[4] = {0, 0, 0, 0};
    for (size_t i = 2; i < n; ++i)
    {
        if (!ParseInt(args.positional[i], coords[i - 2]))
        {
            std::cerr << "Invalid coordinate '" << args.positional[i] << "'\n";
            return kExitUsage;
        }
    }

    // --autosave keeps working on the autosave copy once one exists.
    const bool to_autosave = args.Has("--autosave");
    const std::string autosave = project_file::AutosavePathFor(path);
    const std::string source = (to_autosave && FileExists(autosave)) ? autosave : path;

    kaku::ProjectState st;
    std::string err;
    if (!project_file::LoadProjectFromFile(source, st, err))
    {
        std::cerr << "Failed to load " << source << ": " << err << "\n";
        return kExitError;
    }

    kaku::EditSession session(st.grid);
    session.SetActiveTool(*tool);
    session.SetForeground(st.color);
    session.SetSymmetry(st.symmetry);
    session.SetFilledRect(args.Has("--filled") || cfg.filled_rect);

    if (const auto name = args.Get("--glyph"))
    {
        const auto g = kaku::glyph::FromName(*name);
        if (!g)
        {
            std::cerr << "Unknown glyph '" << *name << "'. Known:";
            for (kaku::Glyph known : kaku::glyph::All())
                std::cerr << " " << kaku::glyph::Name(known);
            std::cerr << "\n";
            return kExitUsage;
        }
        session.SetActiveGlyph(*g);
    }
    for (const char* key : {"--fg", "--bg"})
    {
        if (const auto v = args.Get(key))
        {
            std::optional<Rgb8> c;
            if (!ParseColorArg(*v, c))
            {
                std::cerr << "Invalid " << key << " '" << *v << "' (expected #RRGGBB or none)\n";
                return kExitUsage;
            }
            if (std::string_view(key) == "--fg")
                session.SetForeground(c);
            else
                session.SetBackground(c);
        }
    }
    if (const auto mode = args.Get("--symmetry"))
    {
        const auto m = kaku::SymmetryFromName(*mode);
        if (!m)
        {
            std::cerr << "Unknown symmetry mode '" << *mode << "'\n";
            return kExitUsage;
        }
        session.SetSymmetry(*m);
    }

    size_t changed = session.ApplyTool(coords[0], coords[1]);
    if (n == 6)
        changed += session.ApplyTool(coords[2], coords[3]);

    if (*tool == kaku::tools::ToolKind::Eyedropper)
    {
        std::cout << "glyph " << kaku::glyph::Name(session.GetActiveGlyph()) << " fg "
                  << ColorLabel(session.GetForeground()) << " bg " << ColorLabel(session.GetBackground()) << "\n";
        return kExitOk;
    }

    std::cout << changed << " cell(s) changed\n";
    if (!session.IsDirty())
        return kExitOk;

    st.grid = session.GetGrid();
    if (session.GetForeground())
        st.color = *session.GetForeground();
    st.symmetry = session.GetSymmetry();

    if (to_autosave)
    {
        if (!project_file::SaveAutosave(path, st, err))
        {
            std::cerr << "Failed to save " << autosave << ": " << err << "\n";
            return kExitError;
        }
        return kExitOk;
    }
    return SaveAndDiscardAutosave(path, st) ? kExitOk : kExitError;
}

static int CmdList(const CommandArgs& args)
{
    if (args.positional.size() != 1)
        return kExitUsage;

    const std::string& dir = args.positional[0];
    for (const std::string& name : project_file::ListProjectFiles(dir))
        std::cout << name << "\n";
    if (const auto autosave = project_file::FindAutosave(dir))
        std::cout << "autosave: " << *autosave << "\n";
    return kExitOk;
}

static int CmdColor(const CommandArgs& args)
{
    if (args.positional.size() != 1)
        return kExitUsage;

    const auto c = kaku::color::ParseHexColor(args.positional[0]);
    if (!c)
    {
        std::cerr << "Invalid colour '" << args.positional[0] << "' (expected #RRGGBB)\n";
        return kExitError;
    }

    const kaku::color::Hsl hsl = kaku::color::RgbToHsl(*c);
    const std::uint8_t i256 = kaku::color::Nearest256(*c);
    const std::uint8_t i16 = kaku::color::Nearest16(*c);
    std::cout << "hex:        " << kaku::color::ToHex(*c) << "\n"
              << "rgb:        " << (int)c->r << " " << (int)c->g << " " << (int)c->b << "\n"
              << "hsl:        " << hsl.h << " " << (int)hsl.s << " " << (int)hsl.l << "\n"
              << "nearest256: " << (int)i256 << " " << kaku::color::ToHex(kaku::color::RgbForIndex(i256)) << "\n"
              << "nearest16:  " << (int)i16 << " " << kaku::color::IndexName(i16) << "\n";
    return kExitOk;
}

static int PrintBuiltinPalettes()
{
    std::cout << "default:";
    for (const Rgb8& c : kaku::color::DefaultPalette())
        std::cout << " " << kaku::color::ToHex(c);
    std::cout << "\n";
    for (const kaku::color::HueGroup& g : kaku::color::BuildHueGroups())
    {
        std::cout << g.name << ":";
        for (std::uint8_t idx : g.indices)
            std::cout << " " << (int)idx;
        std::cout << "\n";
    }
    return kExitOk;
}

static int PaletteFailed(const std::string& what, const std::string& err)
{
    std::cerr << what << ": " << err << "\n";
    return kExitError;
}

// Custom palettes live as "<name>.palette" files in --dir (default: current directory).
static int CmdPalette(const CommandArgs& args)
{
    if (args.positional.empty())
        return PrintBuiltinPalettes();

    const std::string dir = args.Get("--dir").value_or(".");
    const std::string& sub = args.positional[0];
    const size_t n = args.positional.size() - 1;
    const auto arg = [&](size_t i) -> const std::string& { return args.positional[i + 1]; };
    std::string err;

    if (sub == "list" && n == 0)
    {
        for (const std::string& name : palette_file::ListPaletteFiles(dir))
            std::cout << name << "\n";
        return kExitOk;
    }
    if (sub == "show" && n == 1)
    {
        kaku::CustomPalette p;
        if (!palette_file::LoadPaletteFromFile(palette_file::PalettePathFor(dir, arg(0)), p, err))
            return PaletteFailed("Load failed", err);
        std::cout << p.name << ":";
        for (const Rgb8& c : p.colors)
            std::cout << " " << kaku::color::ToHex(c);
        std::cout << "\n";
        return kExitOk;
    }
    if (sub == "create" && n == 1)
    {
        kaku::CustomPalette p;
        if (!palette_file::CreatePalette(dir, arg(0), p, err))
            return PaletteFailed("Create failed", err);
        std::cout << "Created palette: " << p.name << "\n";
        return kExitOk;
    }
    if (sub == "add" && n == 2)
    {
        const auto c = kaku::color::ParseHexColor(arg(1));
        if (!c)
        {
            std::cerr << "Invalid colour '" << arg(1) << "' (expected #RRGGBB)\n";
            return kExitUsage;
        }
        bool added = false;
        if (!palette_file::AddColorToPalette(dir, arg(0), *c, added, err))
            return PaletteFailed("Add failed", err);
        if (added)
            std::cout << "Added " << kaku::color::ToHex(*c) << " to " << arg(0) << "\n";
        else
            std::cout << "Colour already in palette (or palette full)\n";
        return kExitOk;
    }
    if (sub == "rename" && n == 2)
    {
        if (!palette_file::RenamePalette(dir, arg(0), arg(1), err))
            return PaletteFailed("Rename failed", err);
        std::cout << "Renamed to: " << arg(1) << "\n";
        return kExitOk;
    }
    if (sub == "duplicate" && n == 1)
    {
        std::string copy;
        if (!palette_file::DuplicatePalette(dir, arg(0), copy, err))
            return PaletteFailed("Duplicate failed", err);
        std::cout << "Duplicated: " << copy << "\n";
        return kExitOk;
    }
    if (sub == "delete" && n == 1)
    {
        if (!palette_file::DeletePalette(dir, arg(0), err))
            return PaletteFailed("Delete failed", err);
        std::cout << "Deleted: " << arg(0) << "\n";
        return kExitOk;
    }
    if (sub == "export" && n == 2)
    {
        if (!palette_file::ExportPalette(dir, arg(0), arg(1), err))
            return PaletteFailed("Export failed", err);
        std::cout << "Exported to: " << arg(1) << "\n";
        return kExitOk;
    }
    return kExitUsage;
}

// One session command (everything except save/quit). Returns false with a
// message in `reply` when the line is rejected; the session keeps going.
static bool RunSessionCommand(kaku::EditSession& session, const std::vector<std::string>& w, std::string& reply)
{
    const std::string& cmd = w[0];
    const size_t n = w.size() - 1;

    if (cmd == "click" && n == 2)
    {
        int x = 0;
        int y = 0;
        if (!ParseInt(w[1], x) || !ParseInt(w[2], y))
        {
            reply = "invalid coordinates";
            return false;
        }
        reply = std::to_string(session.ApplyTool(x, y)) + " cell(s) changed";
        return true;
    }
    if (cmd == "tool" && n == 1)
    {
        const auto t = kaku::tools::ToolFromName(w[1]);
        if (!t)
        {
            reply = "unknown tool '" + w[1] + "'";
            return false;
        }
        session.SetActiveTool(*t);
        return true;
    }
    if (cmd == "glyph" && n == 1)
    {
        const auto g = kaku::glyph::FromName(w[1]);
        if (!g)
        {
            reply = "unknown glyph '" + w[1] + "'";
            return false;
        }
        session.SetActiveGlyph(*g);
        return true;
    }
    if ((cmd == "fg" || cmd == "bg") && n == 1)
    {
        std::optional<Rgb8> c;
        if (!ParseColorArg(w[1], c))
        {
            reply = "invalid colour '" + w[1] + "'";
            return false;
        }
        if (cmd == "fg")
            session.SetForeground(c);
        else
            session.SetBackground(c);
        return true;
    }
    if (cmd == "symmetry" && n == 1)
    {
        const auto m = kaku::SymmetryFromName(w[1]);
        if (!m)
        {
            reply = "unknown symmetry mode '" + w[1] + "'";
            return false;
        }
        session.SetSymmetry(*m);
        return true;
    }
    if (cmd == "filled" && n == 1 && (w[1] == "on" || w[1] == "off"))
    {
        session.SetFilledRect(w[1] == "on");
        return true;
    }
    if (n == 0)
    {
        if (cmd == "begin")
        {
            session.BeginStroke();
            return true;
        }
        if (cmd == "end")
        {
            session.EndStroke();
            return true;
        }
        if (cmd == "undo")
        {
            reply = session.Undo() ? "undone" : "nothing to undo";
            return true;
        }
        if (cmd == "redo")
        {
            reply = session.Redo() ? "redone" : "nothing to redo";
            return true;
        }
        if (cmd == "cancel")
        {
            session.CancelTool();
            return true;
        }
    }
    reply = "unknown command '" + cmd + "'";
    return false;
}

// Edits one project from a stream of commands on stdin. Unsaved work goes to
// the autosave every autosave_interval_sec (checked after each command) and
// once more on exit.
static int CmdSession(const CommandArgs& args, const EditorConfig& cfg)
{
    if (args.positional.size() != 1)
        return kExitUsage;

    const std::string& path = args.positional[0];
    kaku::ProjectState st;
    std::string err;
    if (!project_file::LoadProjectFromFile(path, st, err))
    {
        std::cerr << "Failed to load " << path << ": " << err << "\n";
        return kExitError;
    }

    kaku::EditSession session(st.grid);
    session.SetForeground(st.color);
    session.SetSymmetry(st.symmetry);
    session.SetFilledRect(cfg.filled_rect);

    const auto sync = [&]() {
        st.grid = session.GetGrid();
        if (session.GetForeground())
            st.color = *session.GetForeground();
        st.symmetry = session.GetSymmetry();
    };

    using Clock = std::chrono::steady_clock;
    const Clock::time_point start = Clock::now();
    const auto now_s = [&]() { return std::chrono::duration<double>(Clock::now() - start).count(); };
    project_file::AutosaveTimer timer(cfg.autosave_interval_sec);

    std::string line;
    int line_no = 0;
    bool quit = false;
    while (!quit && std::getline(std::cin, line))
    {
        ++line_no;
        std::vector<std::string> w;
        std::istringstream words(line);
        for (std::string t; words >> t;)
            w.push_back(t);
        if (w.empty() || w[0][0] == '#')
            continue;

        if (w.size() == 1 && w[0] == "quit")
        {
            quit = true;
        }
        else if (w.size() == 1 && w[0] == "save")
        {
            sync();
            if (SaveAndDiscardAutosave(path, st))
            {
                session.MarkSaved();
                std::cout << "saved\n";
            }
        }
        else
        {
            std::string reply;
            if (!RunSessionCommand(session, w, reply))
                std::cerr << "line " << line_no << ": " << reply << "\n";
            else if (!reply.empty())
                std::cout << reply << "\n";
        }

        if (timer.Due(now_s(), session.IsDirty()))
        {
            sync();
            if (project_file::SaveAutosave(path, st, err))
                timer.Restart(now_s());
        }
    }

    if (!session.IsDirty())
        return kExitOk;
    if (!timer.Enabled())
    {
        std::cerr << "Unsaved changes discarded (autosave is disabled)\n";
        return kExitOk;
    }
    sync();
    if (!project_file::SaveAutosave(path, st, err))
        return kExitError;
    std::cerr << "Unsaved changes kept in " << project_file::AutosavePathFor(path) << "\n";
    return kExitOk;
}

// Accepts either the project path or its autosave path.
static int CmdRecover(const CommandArgs& args)
{
    if (args.positional.size() != 1)
        return kExitUsage;

    std::string path = args.positional[0];
    const std::string suffix = project_file::kAutosaveSuffix;
    if (path.size() > suffix.size() && path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0)
        path.resize(path.size() - suffix.size());

    const std::string autosave = project_file::AutosavePathFor(path);
    kaku::ProjectState st;
    std::string err;
    if (!project_file::LoadProjectFromFile(autosave, st, err))
    {
        std::cerr << "Failed to load " << autosave << ": " << err << "\n";
        return kExitError;
    }
    if (!SaveAndDiscardAutosave(path, st))
        return kExitError;
    std::cout << "Recovered " << path << " from " << autosave << "\n";
    return kExitOk;
}
} // namespace

int main(int argc, char** argv)
{
    int i = 1;
    std::string config_path = GetEditorConfigPath();
    for (; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return kExitOk;
        }
        if (a == "--config")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for --config\n";
                PrintUsage(argv[0]);
                return kExitUsage;
            }
            config_path = argv[++i];
            continue;
        }
        break;
    }
    if (i >= argc)
    {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    EditorConfig cfg;
    std::string err;
    if (!LoadEditorConfigFromFile(config_path, cfg, err))
        std::fprintf(stderr, "[config] %s (using defaults)\n", err.c_str());

    const std::string_view cmd = argv[i];
    const CommandArgs args = ParseCommandArgs(argc, argv, i + 1);
    if (!args.error.empty())
    {
        std::cerr << args.error << "\n";
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    int rc = kExitUsage;
    if (cmd == "new")
        rc = CmdNew(args, cfg);
    else if (cmd == "info")
        rc = CmdInfo(args);
    else if (cmd == "export")
        rc = CmdExport(args, cfg);
    else if (cmd == "draw")
        rc = CmdDraw(args, cfg);
    else if (cmd == "list")
        rc = CmdList(args);
    else if (cmd == "color")
        rc = CmdColor(args);
    else if (cmd == "palette")
        rc = CmdPalette(args);
    else if (cmd == "session")
        rc = CmdSession(args, cfg);
    else if (cmd == "recover")
        rc = CmdRecover(args);
    else
        std::cerr << "Unknown command '" << cmd << "'\n";

    if (rc == kExitUsage)
        PrintUsage(argv[0]);
    return rc;
}
