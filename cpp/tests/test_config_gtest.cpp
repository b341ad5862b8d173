// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации сканирования (GoogleTest)
// ==============================================================================

#include "salvage/config.hpp"

#include "test_tree.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace salvage::config::test {

namespace {

ScanConfig with_roots() {
    ScanConfig cfg;
    cfg.scan_root = "/scan";
    cfg.output_root = "/out";
    return cfg;
}

}  // namespace

// ==============================================================================
// YAML
// ==============================================================================

TEST(ConfigTest, LoadString_AllKeys) {
    ScanConfig cfg;
    auto result = load_string("keywords: [backup, \"Homeless Transfer\"]\n"
                              "workers: 4\n"
                              "verify_headers: true\n"
                              "header_bytes: 256\n"
                              "project_extension: ALS\n"
                              "archive_extension: .alp\n"
                              "excludes:\n"
                              "  - /proc\n"
                              "  - /sys\n",
                              cfg);

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(cfg.keywords, (std::vector<std::string>{"backup", "Homeless Transfer"}));
    EXPECT_EQ(cfg.workers, 4);
    EXPECT_TRUE(cfg.verify_headers);
    EXPECT_EQ(cfg.header_bytes, 256u);
    EXPECT_EQ(cfg.project_extension, "ALS");
    EXPECT_EQ(cfg.archive_extension, ".alp");
    ASSERT_EQ(cfg.excludes.size(), 2u);
    EXPECT_EQ(cfg.excludes[0], std::filesystem::path("/proc"));
}

TEST(ConfigTest, LoadString_ScalarKeyword) {
    ScanConfig cfg;
    auto result = load_string("keywords: backup\n", cfg);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(cfg.keywords, (std::vector<std::string>{"backup"}));
}

TEST(ConfigTest, LoadString_KeywordsAppended) {
    ScanConfig cfg;
    cfg.keywords = {"existing"};

    ASSERT_TRUE(load_string("keywords: [added]\n", cfg).ok);

    EXPECT_EQ(cfg.keywords, (std::vector<std::string>{"existing", "added"}));
}

TEST(ConfigTest, LoadString_Empty_Ok) {
    ScanConfig cfg;
    auto result = load_string("", cfg);

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(cfg.workers, 0);
    EXPECT_EQ(cfg.header_bytes, 128u);
}

TEST(ConfigTest, LoadString_NotAMapping_Error) {
    ScanConfig cfg;
    auto result = load_string("- just\n- a list\n", cfg);

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("mapping"), std::string::npos);
}

TEST(ConfigTest, LoadString_BadYaml_Error) {
    ScanConfig cfg;
    auto result = load_string("keywords: [unterminated\n", cfg);

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("YAML"), std::string::npos);
}

TEST(ConfigTest, LoadString_WrongType_Error) {
    ScanConfig cfg;
    auto result = load_string("workers: many\n", cfg);

    EXPECT_FALSE(result.ok);
}

class ConfigFileTest : public salvage::test::TempTreeTest {};

TEST_F(ConfigFileTest, LoadFile_ReadsYaml) {
    auto path = write_file("salvage.yml", "keywords: [mix]\nverify_headers: true\n");

    ScanConfig cfg;
    auto result = load_file(path, cfg);

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(cfg.keywords, (std::vector<std::string>{"mix"}));
    EXPECT_TRUE(cfg.verify_headers);
}

TEST_F(ConfigFileTest, LoadFile_Missing_Error) {
    ScanConfig cfg;
    auto result = load_file(test_dir_ / "nope.yml", cfg);

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("nope.yml"), std::string::npos);
}

// ==============================================================================
// validate
// ==============================================================================

TEST(ConfigTest, Validate_Defaults_Ok) {
    auto cfg = with_roots();
    auto result = validate(cfg);

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(cfg.project_extension, "als");
    EXPECT_EQ(cfg.archive_extension, "alp");
}

TEST(ConfigTest, Validate_RootsRequired) {
    ScanConfig cfg;
    cfg.output_root = "/out";
    EXPECT_FALSE(validate(cfg).ok);

    cfg.scan_root = "/scan";
    cfg.output_root.clear();
    EXPECT_FALSE(validate(cfg).ok);
}

TEST(ConfigTest, Validate_NegativeWorkers_Error) {
    auto cfg = with_roots();
    cfg.workers = -1;
    EXPECT_FALSE(validate(cfg).ok);
}

TEST(ConfigTest, Validate_HeaderBytesBounds) {
    auto cfg = with_roots();

    cfg.header_bytes = kMinHeaderBytes;
    EXPECT_TRUE(validate(cfg).ok);
    cfg.header_bytes = kMaxHeaderBytes;
    EXPECT_TRUE(validate(cfg).ok);
    cfg.header_bytes = kMinHeaderBytes - 1;
    EXPECT_FALSE(validate(cfg).ok);
    cfg.header_bytes = kMaxHeaderBytes + 1;
    EXPECT_FALSE(validate(cfg).ok);
}

TEST(ConfigTest, Validate_ExtensionsNormalized) {
    auto cfg = with_roots();
    cfg.project_extension = ".ALS";
    cfg.archive_extension = "..Alp";

    ASSERT_TRUE(validate(cfg).ok);
    EXPECT_EQ(cfg.project_extension, "als");
    EXPECT_EQ(cfg.archive_extension, "alp");
}

TEST(ConfigTest, Validate_SameExtensions_Error) {
    auto cfg = with_roots();
    cfg.project_extension = "als";
    cfg.archive_extension = ".ALS";

    EXPECT_FALSE(validate(cfg).ok);
}

TEST(ConfigTest, Validate_EmptyExtension_Error) {
    auto cfg = with_roots();
    cfg.archive_extension = ".";

    EXPECT_FALSE(validate(cfg).ok);
}

TEST(ConfigTest, Validate_RootsMadeAbsoluteAndNormal) {
    ScanConfig cfg;
    cfg.scan_root = "relative/./scan/../drive";
    cfg.output_root = "out";

    ASSERT_TRUE(validate(cfg).ok);
    EXPECT_TRUE(cfg.scan_root.is_absolute());
    EXPECT_TRUE(cfg.output_root.is_absolute());
    EXPECT_EQ(cfg.scan_root.filename(), std::filesystem::path("drive"));
    EXPECT_EQ(cfg.scan_root.parent_path().filename(), std::filesystem::path("relative"));
}

TEST(ConfigTest, ClassifierRules_FromConfig) {
    auto cfg = with_roots();
    cfg.project_extension = "xyz";
    cfg.header_bytes = 64;
    cfg.verify_headers = true;

    auto rules = classifier_rules(cfg);

    EXPECT_EQ(rules.project_extension, "xyz");
    EXPECT_EQ(rules.archive_extension, "alp");
    EXPECT_EQ(rules.header_bytes, 64u);
    EXPECT_TRUE(rules.verify_headers);
}

}  // namespace salvage::config::test
