// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include "salvage/platform.hpp"

#include "test_tree.hpp"

#include <chrono>
#include <filesystem>
#include <gtest/gtest.h>
#include <set>
#include <string>

namespace salvage::platform::test {

// ==============================================================================
// Идентификация платформы
// ==============================================================================

TEST(PlatformTest, OsName_Known) {
    std::string name = os_name();

    EXPECT_TRUE(name == "Windows" || name == "Linux" || name == "macOS") << name;
    EXPECT_EQ(name, os_name());
}

TEST(PlatformTest, HardwareThreads_AtLeastOne) {
    EXPECT_GE(hardware_threads(), 1u);
}

// ==============================================================================
// Преобразование путей UTF-8 <-> path
// ==============================================================================

TEST(PlatformTest, Utf8_RoundTrip_NonAscii) {
    // "Проект/Song.als"
    const std::string u8 = "\xd0\x9f\xd1\x80\xd0\xbe\xd0\xb5\xd0\xba\xd1\x82/Song.als";

    std::filesystem::path p = path_from_utf8(u8);

    EXPECT_EQ(p.filename(), std::filesystem::path("Song.als"));
    EXPECT_EQ(path_to_utf8(p.parent_path()), "\xd0\x9f\xd1\x80\xd0\xbe\xd0\xb5\xd0\xba\xd1\x82");
    EXPECT_EQ(path_to_utf8(p), u8);
}

TEST(PlatformTest, Utf8_Empty) {
    EXPECT_TRUE(path_from_utf8("").empty());
    EXPECT_EQ(path_to_utf8(std::filesystem::path()), "");
}

// ==============================================================================
// Временные файлы
// ==============================================================================

TEST(PlatformTest, TempSibling_SameDirectoryHidden) {
    const std::filesystem::path target = "/out/ProjectFiles/a/Song.als";

    auto tmp = temp_sibling(target);

    EXPECT_EQ(tmp.parent_path(), target.parent_path());
    const std::string name = path_to_utf8(tmp.filename());
    ASSERT_FALSE(name.empty());
    EXPECT_EQ(name[0], '.');
    EXPECT_NE(name.find(".partial"), std::string::npos);
    EXPECT_NE(tmp, target);
}

TEST(PlatformTest, TempSibling_LongTargetName_ShortTempName) {
    const std::string long_name = std::string(251, 'a') + ".als";
    const std::filesystem::path target = std::filesystem::path("/out/ProjectFiles") / long_name;

    auto tmp = temp_sibling(target);

    EXPECT_EQ(tmp.parent_path(), target.parent_path());
    EXPECT_EQ(path_to_utf8(tmp.filename()).find('a'), std::string::npos);
    EXPECT_LT(path_to_utf8(tmp.filename()).size(), 64u);
}

TEST(PlatformTest, TempSibling_Unique) {
    const std::filesystem::path target = "/out/Song.als";

    std::set<std::filesystem::path> names;
    for (int i = 0; i < 100; ++i) {
        names.insert(temp_sibling(target));
    }

    EXPECT_EQ(names.size(), 100u);
}

// ==============================================================================
// Временные метки
// ==============================================================================

class PlatformFileTest : public salvage::test::TempTreeTest {};

TEST_F(PlatformFileTest, CopyTimestamps_MtimeTransferred) {
    auto src = write_file("src.als", "a");
    auto dst = write_file("dst.als", "b");
    const auto old_time = std::filesystem::last_write_time(src) - std::chrono::hours(24 * 30);
    std::filesystem::last_write_time(src, old_time);

    std::error_code ec;
    ASSERT_TRUE(copy_timestamps(src, dst, ec)) << ec.message();

    EXPECT_EQ(std::filesystem::last_write_time(dst), old_time);
}

TEST_F(PlatformFileTest, CopyTimestamps_MissingSource_Error) {
    auto dst = write_file("dst.als", "b");

    std::error_code ec;
    EXPECT_FALSE(copy_timestamps(test_dir_ / "nope.als", dst, ec));
    EXPECT_TRUE(static_cast<bool>(ec));
}

}  // namespace salvage::platform::test
