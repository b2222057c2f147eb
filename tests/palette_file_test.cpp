#include "io/palette_file.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

using namespace kaku;
namespace fs = std::filesystem;

namespace
{
constexpr Rgb8 kGreen{0, 95, 0};
constexpr Rgb8 kTeal{0, 135, 135};

class PaletteFileTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir = fs::temp_directory_path() /
              (std::string("kaku_palette_file_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string Dir() const { return dir.string(); }
    std::string PathOf(const std::string& name) const { return (dir / name).string(); }

    static void WriteText(const std::string& path, const std::string& text)
    {
        std::ofstream out(path, std::ios::binary);
        out << text;
    }

    CustomPalette Load(const std::string& name) const
    {
        CustomPalette p;
        std::string err;
        EXPECT_TRUE(palette_file::LoadPaletteFromFile(palette_file::PalettePathFor(Dir(), name), p, err)) << err;
        return p;
    }

    fs::path dir;
};
} // namespace

TEST(CustomPaletteTest, AddColorRejectsDuplicatesAndOverflow)
{
    CustomPalette p;
    EXPECT_TRUE(p.AddColor(kGreen));
    EXPECT_FALSE(p.AddColor(kGreen));
    EXPECT_TRUE(p.AddColor(kTeal));
    EXPECT_EQ(p.colors, (std::vector<Rgb8>{kGreen, kTeal}));

    CustomPalette full;
    for (int i = 0; i < 256; ++i)
        ASSERT_TRUE(full.AddColor(Rgb8{(std::uint8_t)i, 0, 0})) << i;
    EXPECT_FALSE(full.Contains(Rgb8{1, 2, 3}));
    EXPECT_FALSE(full.AddColor(Rgb8{1, 2, 3}));
    EXPECT_EQ(full.colors.size(), CustomPalette::kMaxColors);
}

TEST_F(PaletteFileTest, SaveLoadRoundTrip)
{
    CustomPalette p;
    p.name = "Forest";
    p.colors = {kGreen, kTeal};

    const std::string path = PathOf("Forest.palette");
    std::string err;
    ASSERT_TRUE(palette_file::SavePaletteToFile(path, p, err)) << err;
    EXPECT_FALSE(fs::exists(path + ".tmp"));

    CustomPalette back;
    ASSERT_TRUE(palette_file::LoadPaletteFromFile(path, back, err)) << err;
    EXPECT_EQ(back.name, "Forest");
    EXPECT_EQ(back.colors, p.colors);
}

TEST_F(PaletteFileTest, LoadsIndexColorsAndSkipsInvalidEntries)
{
    const std::string path = PathOf("old.palette");
    WriteText(path, R"({"name": "Old", "colors": [22, "#008787", 999, "nope", 22]})");

    CustomPalette p;
    std::string err;
    ASSERT_TRUE(palette_file::LoadPaletteFromFile(path, p, err)) << err;
    EXPECT_EQ(p.name, "Old");
    EXPECT_EQ(p.colors, (std::vector<Rgb8>{color::RgbForIndex(22), kTeal}));
}

TEST_F(PaletteFileTest, MalformedFilesAreErrors)
{
    CustomPalette p;
    std::string err;

    WriteText(PathOf("a.palette"), "{ \"name\": ");
    EXPECT_FALSE(palette_file::LoadPaletteFromFile(PathOf("a.palette"), p, err));
    EXPECT_FALSE(err.empty());

    WriteText(PathOf("b.palette"), R"({"colors": []})");
    EXPECT_FALSE(palette_file::LoadPaletteFromFile(PathOf("b.palette"), p, err));

    WriteText(PathOf("c.palette"), R"({"name": "C", "colors": "#ffffff"})");
    EXPECT_FALSE(palette_file::LoadPaletteFromFile(PathOf("c.palette"), p, err));

    EXPECT_FALSE(palette_file::LoadPaletteFromFile(PathOf("missing.palette"), p, err));
}

TEST_F(PaletteFileTest, ListOnlyPaletteFilesSorted)
{
    WriteText(PathOf("ocean.palette"), "{}");
    WriteText(PathOf("forest.palette"), "{}");
    WriteText(PathOf("not_a_palette.txt"), "nope");

    EXPECT_EQ(palette_file::ListPaletteFiles(Dir()), (std::vector<std::string>{"forest.palette", "ocean.palette"}));
    EXPECT_TRUE(palette_file::ListPaletteFiles(PathOf("nope")).empty());
}

TEST_F(PaletteFileTest, CreateWritesEmptyPaletteOnce)
{
    CustomPalette p;
    std::string err;
    ASSERT_TRUE(palette_file::CreatePalette(Dir(), "Sky", p, err)) << err;
    EXPECT_EQ(p.name, "Sky");
    EXPECT_TRUE(p.colors.empty());
    EXPECT_TRUE(fs::exists(PathOf("Sky.palette")));

    EXPECT_FALSE(palette_file::CreatePalette(Dir(), "Sky", p, err));
    EXPECT_FALSE(err.empty());
}

TEST_F(PaletteFileTest, InvalidNamesAreRejected)
{
    EXPECT_FALSE(palette_file::IsValidPaletteName(""));
    EXPECT_FALSE(palette_file::IsValidPaletteName(".."));
    EXPECT_FALSE(palette_file::IsValidPaletteName("a/b"));
    EXPECT_TRUE(palette_file::IsValidPaletteName("Warm Tones (v2)"));

    CustomPalette p;
    std::string err;
    EXPECT_FALSE(palette_file::CreatePalette(Dir(), "../escape", p, err));
    EXPECT_FALSE(fs::exists(dir.parent_path() / "escape.palette"));
}

TEST_F(PaletteFileTest, AddColorPersistsOnlyNewColors)
{
    CustomPalette p;
    std::string err;
    ASSERT_TRUE(palette_file::CreatePalette(Dir(), "Mix", p, err)) << err;

    bool added = false;
    ASSERT_TRUE(palette_file::AddColorToPalette(Dir(), "Mix", kGreen, added, err)) << err;
    EXPECT_TRUE(added);
    ASSERT_TRUE(palette_file::AddColorToPalette(Dir(), "Mix", kGreen, added, err)) << err;
    EXPECT_FALSE(added);
    ASSERT_TRUE(palette_file::AddColorToPalette(Dir(), "Mix", kTeal, added, err)) << err;
    EXPECT_TRUE(added);

    EXPECT_EQ(Load("Mix").colors, (std::vector<Rgb8>{kGreen, kTeal}));
    EXPECT_FALSE(palette_file::AddColorToPalette(Dir(), "Nope", kGreen, added, err));
}

TEST_F(PaletteFileTest, RenameMovesFileAndName)
{
    CustomPalette p;
    p.name = "OldName";
    p.colors = {kGreen};
    std::string err;
    ASSERT_TRUE(palette_file::SavePaletteToFile(PathOf("OldName.palette"), p, err)) << err;

    ASSERT_TRUE(palette_file::RenamePalette(Dir(), "OldName", "NewName", err)) << err;
    EXPECT_FALSE(fs::exists(PathOf("OldName.palette")));
    const CustomPalette back = Load("NewName");
    EXPECT_EQ(back.name, "NewName");
    EXPECT_EQ(back.colors, p.colors);
}

TEST_F(PaletteFileTest, RenameToExistingNameIsBlocked)
{
    CustomPalette a;
    a.name = "A";
    a.colors = {kGreen};
    CustomPalette b;
    b.name = "B";
    b.colors = {kTeal};
    std::string err;
    ASSERT_TRUE(palette_file::SavePaletteToFile(PathOf("A.palette"), a, err)) << err;
    ASSERT_TRUE(palette_file::SavePaletteToFile(PathOf("B.palette"), b, err)) << err;

    EXPECT_FALSE(palette_file::RenamePalette(Dir(), "A", "B", err));
    EXPECT_NE(err.find("already exists"), std::string::npos) << err;

    // Neither file was touched.
    EXPECT_EQ(Load("A").colors, a.colors);
    EXPECT_EQ(Load("B").colors, b.colors);
}

TEST_F(PaletteFileTest, DuplicateAddsCopySuffix)
{
    CustomPalette p;
    p.name = "Original";
    p.colors = {kGreen, kTeal};
    std::string err;
    ASSERT_TRUE(palette_file::SavePaletteToFile(PathOf("Original.palette"), p, err)) << err;

    std::string copy;
    ASSERT_TRUE(palette_file::DuplicatePalette(Dir(), "Original", copy, err)) << err;
    EXPECT_EQ(copy, "Original (Copy)");
    EXPECT_TRUE(fs::exists(PathOf("Original.palette")));

    const CustomPalette back = Load(copy);
    EXPECT_EQ(back.name, "Original (Copy)");
    EXPECT_EQ(back.colors, p.colors);

    // A second duplicate would overwrite the first copy.
    EXPECT_FALSE(palette_file::DuplicatePalette(Dir(), "Original", copy, err));
}

TEST_F(PaletteFileTest, DeleteRemovesFile)
{
    CustomPalette p;
    std::string err;
    ASSERT_TRUE(palette_file::CreatePalette(Dir(), "ToDelete", p, err)) << err;

    ASSERT_TRUE(palette_file::DeletePalette(Dir(), "ToDelete", err)) << err;
    EXPECT_FALSE(fs::exists(PathOf("ToDelete.palette")));

    EXPECT_FALSE(palette_file::DeletePalette(Dir(), "ToDelete", err));
    EXPECT_FALSE(err.empty());
}

TEST_F(PaletteFileTest, ExportWritesLoadableCopy)
{
    CustomPalette p;
    p.name = "ExportMe";
    p.colors = {kTeal};
    std::string err;
    ASSERT_TRUE(palette_file::SavePaletteToFile(PathOf("ExportMe.palette"), p, err)) << err;

    const std::string dest = PathOf("shared/exported_copy.palette");
    ASSERT_TRUE(palette_file::ExportPalette(Dir(), "ExportMe", dest, err)) << err;

    CustomPalette back;
    ASSERT_TRUE(palette_file::LoadPaletteFromFile(dest, back, err)) << err;
    EXPECT_EQ(back.name, "ExportMe");
    EXPECT_EQ(back.colors, p.colors);
    EXPECT_TRUE(fs::exists(PathOf("ExportMe.palette")));
}
