#pragma once

#include "core/project_state.h"

#include <optional>
#include <string>
#include <vector>

namespace project_file
{
inline constexpr const char* kProjectExtension = ".kaku";
inline constexpr const char* kAutosaveSuffix = ".autosave";

// Save/load kaku project files (*.kaku).
//
// Format: zstd-wrapped CBOR with a small header (see implementation). Plain JSON
// documents (hand-written or produced by older versions) are accepted on load.
//
// Saving stamps st.modified_at (and st.created_at when empty) with the current time.
bool SaveProjectToFile(const std::string& path, kaku::ProjectState& st, std::string& err);
bool LoadProjectFromFile(const std::string& path, kaku::ProjectState& out, std::string& err);

// Writes st to AutosavePathFor(path) without touching its timestamps.
bool SaveAutosave(const std::string& path, const kaku::ProjectState& st, std::string& err);

// Fresh project with both timestamps set to now.
kaku::ProjectState NewProjectState(const std::string& name, kaku::Grid grid);

// "YYYY-MM-DDTHH:MM:SSZ"
std::string NowIso8601Utc();

// "<path>.autosave"
std::string AutosavePathFor(const std::string& path);

// Removes AutosavePathFor(path) after a successful save. A missing autosave is
// not an error.
bool DiscardAutosave(const std::string& path, std::string& err);

// First "*.kaku.autosave" file name in dir (sorted by name), if any.
std::optional<std::string> FindAutosave(const std::string& dir);

// "*.kaku" file names in dir, sorted. Missing/unreadable dir yields an empty list.
std::vector<std::string> ListProjectFiles(const std::string& dir);

// Periodic autosave gate driven by the caller's clock (seconds).
//
// The interval counts from the first unsaved change: while the document is clean
// the clock keeps restarting, so a long idle stretch does not trigger an
// immediate autosave on the next edit. interval_sec <= 0 disables autosave.
class AutosaveTimer
{
public:
    explicit AutosaveTimer(int interval_sec)
        : m_interval_s(interval_sec)
    {
    }

    bool Enabled() const { return m_interval_s > 0; }

    // True when the document is dirty and a full interval has passed since the
    // clock last restarted. Call Restart() after writing the autosave.
    bool Due(double now_s, bool dirty);
    void Restart(double now_s)
    {
        m_last_s = now_s;
        m_started = true;
    }

private:
    int    m_interval_s = 0;
    double m_last_s = 0.0;
    bool   m_started = false;
};
} // namespace project_file
