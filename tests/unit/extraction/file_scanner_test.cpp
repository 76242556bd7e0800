#include <cartograph/extraction/file_scanner.h>

#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cartograph;
using namespace cartograph::extraction;
using cartograph::tests::make_temp_dir;
using cartograph::tests::write_file;

TEST(FileScannerTest, DetectsLanguageByExtension) {
    EXPECT_EQ(detectLanguage("app/main.py"), "python");
    EXPECT_EQ(detectLanguage("ui/View.TSX"), "react");
    EXPECT_EQ(detectLanguage("lib/util.hpp"), "cpp_header");
    EXPECT_EQ(detectLanguage("settings.yaml"), "yaml");
    EXPECT_EQ(detectLanguage("Makefile"), "unknown");
    EXPECT_EQ(detectLanguage("archive.tar.gz"), "unknown");

    EXPECT_TRUE(isSourceLanguage("python"));
    EXPECT_TRUE(isSourceLanguage("cobol"));
    EXPECT_FALSE(isSourceLanguage("json"));
    EXPECT_FALSE(isSourceLanguage("unknown"));
}

class ScanProjectTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = make_temp_dir("cartograph_scan_");
        write_file(root_ / "main.py", "print('hi')\n");
        write_file(root_ / "pkg" / "__init__.py", "");
        write_file(root_ / "pkg" / "models.py", "class A: pass\n");
        write_file(root_ / "config" / "settings.json", "{}");
        write_file(root_ / ".git" / "HEAD", "ref: refs/heads/main\n");
        write_file(root_ / ".env", "SECRET=1\n");
    }
    void TearDown() override { std::filesystem::remove_all(root_); }

    std::filesystem::path root_;
};

TEST_F(ScanProjectTest, ListsRegularFilesSortedAndRelative) {
    auto files = scanProject(root_);
    ASSERT_TRUE(files) << files.error().message;

    std::vector<std::string> paths;
    for (const auto& f : files.value())
        paths.push_back(f.path);
    EXPECT_EQ(paths, (std::vector<std::string>{"config/settings.json", "main.py",
                                               "pkg/__init__.py", "pkg/models.py"}));

    const auto& models = files.value()[3];
    EXPECT_EQ(models.language, "python");
    EXPECT_EQ(models.extension, ".py");
    EXPECT_EQ(models.size, 14u);
    EXPECT_TRUE(std::filesystem::path(models.absolutePath).is_absolute());
}

TEST_F(ScanProjectTest, HiddenEntriesIncludedOnRequest) {
    auto files = scanProject(root_, ScanOptions{.skipHidden = false});
    ASSERT_TRUE(files);
    EXPECT_EQ(files.value().size(), 6u);
}

TEST_F(ScanProjectTest, MissingRootIsFileNotFound) {
    auto files = scanProject(root_ / "nope");
    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, ErrorCode::FileNotFound);
}

TEST_F(ScanProjectTest, EmptyDirectoryYieldsNoFiles) {
    auto empty = make_temp_dir("cartograph_empty_");
    auto files = scanProject(empty);
    ASSERT_TRUE(files);
    EXPECT_TRUE(files.value().empty());
    std::filesystem::remove_all(empty);
}
