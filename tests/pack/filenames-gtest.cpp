#include "cpak/pack/filenames.h"
#include "cpak/test-utils/test-utils.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace cpak;
using namespace cpak::pack;

TEST(SafeFilename, KeepsAsciiAlphanumerics)
{
    EXPECT_EQ(safe_filename("Hero"), "Hero");
    EXPECT_EQ(safe_filename("Goblin42"), "Goblin42");
}

TEST(SafeFilename, ReplacesEveryOtherCharacter)
{
    EXPECT_EQ(safe_filename("Potion of Healing"), "Potion_of_Healing");
    EXPECT_EQ(safe_filename("Dragon's Breath!"), "Dragon_s_Breath_");
    EXPECT_EQ(safe_filename("a/b\\c.d"), "a_b_c_d");
    EXPECT_EQ(safe_filename(""), "");
}

TEST(SafeFilename, DecomposesAccentsAndKeepsCombiningMarks)
{
    // "é" becomes "e" followed by U+0301 COMBINING ACUTE ACCENT
    EXPECT_EQ(safe_filename("Caf\xC3\xA9"), "Cafe\xCC\x81");
}

TEST(SafeFilename, ReplacesEachCodePointOnce)
{
    // Two CJK characters, each three bytes of UTF-8
    EXPECT_EQ(safe_filename("\xE9\xBE\x8D\xE7\x8E\x8B"), "__");
}

TEST(DisplayName, NamedAndUnnamed)
{
    EXPECT_EQ(display_name(std::string("Hero"), "abc", "!actors!abc"), "Hero_abc");
    EXPECT_EQ(display_name(std::nullopt, "abc", "!actors!abc"), "!actors!abc");
    EXPECT_EQ(display_name(std::string(), "abc", "!actors!abc"), "!actors!abc");
}

TEST(FindSourceFiles, FiltersByFormatAndSorts)
{
    TempDir dir("cpak-sources");
    write_text_file(dir / "b.json", "{}");
    write_text_file(dir / "a.json", "{}");
    write_text_file(dir / "c.yml", "{}");
    write_text_file(dir / "d.yaml", "{}");
    write_text_file(dir / "notes.txt", "");
    write_text_file(dir / "sub/e.json", "{}");
    write_text_file(dir / "sub/f.yml", "{}");

    auto names = [&](const std::vector<boost::filesystem::path>& files) {
        std::vector<std::string> out;
        for (const auto& file : files)
            out.push_back(
                boost::filesystem::relative(file, dir.path()).generic_string());
        return out;
    };

    EXPECT_EQ(
        names(find_source_files(dir.path(), document::Format::JSON, false)),
        (std::vector<std::string>{"a.json", "b.json"}));
    EXPECT_EQ(
        names(find_source_files(dir.path(), document::Format::JSON, true)),
        (std::vector<std::string>{"a.json", "b.json", "sub/e.json"}));
    EXPECT_EQ(
        names(find_source_files(dir.path(), document::Format::YAML, true)),
        (std::vector<std::string>{"c.yml", "d.yaml", "sub/f.yml"}));
}

TEST(FindSourceFiles, DirectoriesNamedLikeSourcesAreSkipped)
{
    TempDir dir("cpak-sources");
    boost::filesystem::create_directories(dir / "odd.json");
    write_text_file(dir / "real.json", "{}");

    auto files = find_source_files(dir.path(), document::Format::JSON, false);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename().string(), "real.json");
}
