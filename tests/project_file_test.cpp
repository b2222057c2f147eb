#include "io/project_file.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <regex>
#include <string>
#include <system_error>
#include <vector>

using namespace kaku;
namespace fs = std::filesystem;

namespace
{
class ProjectFileTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir = fs::temp_directory_path() /
              (std::string("kaku_project_file_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string PathOf(const std::string& name) const { return (dir / name).string(); }

    static void WriteText(const std::string& path, const std::string& text)
    {
        std::ofstream out(path, std::ios::binary);
        out << text;
    }

    fs::path dir;
};
} // namespace

TEST_F(ProjectFileTest, SaveLoadRoundTrip)
{
    ProjectState st = project_file::NewProjectState("round-trip", Grid(20, 10));
    st.color = Rgb8{1, 2, 3};
    st.symmetry = SymmetryMode::Vertical;
    st.grid.Set(5, 9, Cell{glyph::kUpperHalf, Rgb8{255, 0, 0}, Rgb8{0, 0, 255}});

    const std::string path = PathOf("art.kaku");
    std::string err;
    ASSERT_TRUE(project_file::SaveProjectToFile(path, st, err)) << err;
    EXPECT_FALSE(fs::exists(path + ".tmp"));

    // Header: "KAKU" magic.
    std::ifstream in(path, std::ios::binary);
    char magic[4] = {};
    in.read(magic, 4);
    EXPECT_EQ(std::string(magic, 4), "KAKU");

    ProjectState back;
    ASSERT_TRUE(project_file::LoadProjectFromFile(path, back, err)) << err;
    EXPECT_EQ(back.name, "round-trip");
    EXPECT_EQ(back.version, ProjectState::kCurrentVersion);
    EXPECT_EQ(back.color, st.color);
    EXPECT_EQ(back.symmetry, SymmetryMode::Vertical);
    EXPECT_EQ(back.grid, st.grid);
    EXPECT_EQ(back.created_at, st.created_at);
    EXPECT_EQ(back.modified_at, st.modified_at);
}

TEST_F(ProjectFileTest, SaveStampsTimestamps)
{
    ProjectState st;
    std::string err;
    ASSERT_TRUE(project_file::SaveProjectToFile(PathOf("t.kaku"), st, err)) << err;
    const std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)");
    EXPECT_TRUE(std::regex_match(st.modified_at, iso)) << st.modified_at;
    EXPECT_EQ(st.created_at, st.modified_at);
    EXPECT_TRUE(std::regex_match(project_file::NowIso8601Utc(), iso));
}

TEST_F(ProjectFileTest, LoadsPlainJson)
{
    const std::string path = PathOf("legacy.kaku");
    WriteText(path, R"({"version": 2, "name": "legacy", "color": 9, "symmetry": "Off",
                        "canvas": {"width": 8, "height": 8, "cells": [[{"block": "Full", "fg": 1, "bg": 0}]]}})");

    ProjectState st;
    std::string err;
    ASSERT_TRUE(project_file::LoadProjectFromFile(path, st, err)) << err;
    EXPECT_EQ(st.name, "legacy");
    EXPECT_EQ(st.version, 2);
    EXPECT_EQ(st.grid.Get(0, 0)->glyph, glyph::kFull);
}

TEST_F(ProjectFileTest, RejectsNewerVersionInPlainJson)
{
    const std::string path = PathOf("future.kaku");
    WriteText(path, R"({"version": 9, "canvas": {}})");
    ProjectState st;
    std::string err;
    EXPECT_FALSE(project_file::LoadProjectFromFile(path, st, err));
    EXPECT_NE(err.find("newer"), std::string::npos) << err;
}

TEST_F(ProjectFileTest, LoadErrors)
{
    ProjectState st;
    std::string err;
    EXPECT_FALSE(project_file::LoadProjectFromFile(PathOf("missing.kaku"), st, err));
    EXPECT_FALSE(err.empty());

    WriteText(PathOf("garbage.kaku"), "not a project");
    EXPECT_FALSE(project_file::LoadProjectFromFile(PathOf("garbage.kaku"), st, err));

    WriteText(PathOf("truncated.kaku"), "KAKU\x01");
    EXPECT_FALSE(project_file::LoadProjectFromFile(PathOf("truncated.kaku"), st, err));

    WriteText(PathOf("broken.kaku"), "{ \"version\": ");
    EXPECT_FALSE(project_file::LoadProjectFromFile(PathOf("broken.kaku"), st, err));
}

TEST_F(ProjectFileTest, AutosaveAndListing)
{
    const std::string path = PathOf("b.kaku");
    ProjectState st = project_file::NewProjectState("b", Grid());
    std::string err;
    ASSERT_TRUE(project_file::SaveProjectToFile(PathOf("a.kaku"), st, err)) << err;
    ASSERT_TRUE(project_file::SaveProjectToFile(path, st, err)) << err;
    WriteText(PathOf("notes.txt"), "x");

    EXPECT_FALSE(project_file::FindAutosave(dir.string()).has_value());

    ASSERT_TRUE(project_file::SaveAutosave(path, st, err)) << err;
    EXPECT_EQ(project_file::AutosavePathFor(path), path + ".autosave");
    EXPECT_EQ(project_file::FindAutosave(dir.string()), std::optional<std::string>("b.kaku.autosave"));

    ProjectState recovered;
    ASSERT_TRUE(project_file::LoadProjectFromFile(project_file::AutosavePathFor(path), recovered, err)) << err;
    EXPECT_EQ(recovered.name, "b");

    EXPECT_EQ(project_file::ListProjectFiles(dir.string()), (std::vector<std::string>{"a.kaku", "b.kaku"}));
    EXPECT_TRUE(project_file::ListProjectFiles((dir / "nope").string()).empty());
}

TEST_F(ProjectFileTest, DiscardAutosaveRemovesOnlyTheAutosave)
{
    const std::string path = PathOf("c.kaku");
    ProjectState st = project_file::NewProjectState("c", Grid());
    std::string err;
    ASSERT_TRUE(project_file::SaveProjectToFile(path, st, err)) << err;
    ASSERT_TRUE(project_file::SaveAutosave(path, st, err)) << err;

    ASSERT_TRUE(project_file::DiscardAutosave(path, err)) << err;
    EXPECT_FALSE(fs::exists(project_file::AutosavePathFor(path)));
    EXPECT_TRUE(fs::exists(path));

    // Nothing left to remove is still a success.
    EXPECT_TRUE(project_file::DiscardAutosave(path, err)) << err;
}

TEST(AutosaveTimerTest, DisabledNeverFires)
{
    project_file::AutosaveTimer timer(0);
    EXPECT_FALSE(timer.Enabled());
    EXPECT_FALSE(timer.Due(0.0, true));
    EXPECT_FALSE(timer.Due(1.0e6, true));
}

TEST(AutosaveTimerTest, FiresAfterIntervalOfUnsavedChanges)
{
    project_file::AutosaveTimer timer(60);
    EXPECT_FALSE(timer.Due(100.0, true)); // first call starts the clock
    EXPECT_FALSE(timer.Due(159.0, true));
    EXPECT_TRUE(timer.Due(160.0, true));

    timer.Restart(160.0);
    EXPECT_FALSE(timer.Due(200.0, true));
    EXPECT_TRUE(timer.Due(220.0, true));
}

TEST(AutosaveTimerTest, CleanDocumentRestartsTheClock)
{
    project_file::AutosaveTimer timer(60);
    EXPECT_FALSE(timer.Due(0.0, false));
    EXPECT_FALSE(timer.Due(500.0, false));
    // First edit after a long idle stretch does not fire immediately.
    EXPECT_FALSE(timer.Due(501.0, true));
    EXPECT_TRUE(timer.Due(560.0, true));
}
