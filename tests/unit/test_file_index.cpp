#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "sandbox/file_index.hpp"
#include "test_support.hpp"

namespace {

using rlm::sandbox::ClassifyFile;
using rlm::sandbox::FileIndex;
using rlm::testing::TempDir;

class FileIndexTest : public ::testing::Test {
protected:
    FileIndexTest()
        : dir_("rlm_index") {
        dir_.Write("main.py", "print('hi')\n");
        dir_.Write("docs/guide.md", "# guide\n");
        dir_.Write("docs/api.md", "# api\n");
        dir_.Write(".env", "SECRET=1\n");
        dir_.Write(".git/HEAD", "ref: main\n");
        dir_.Write("__pycache__/main.cpython-311.pyc", std::string("\0\1\2", 3));
        dir_.Write("assets/logo.bin", std::string("PNG\0data", 8));
    }

    TempDir dir_;
};

TEST_F(FileIndexTest, RebuildSkipsHiddenAndCacheEntries) {
    FileIndex index(dir_.Path());
    EXPECT_EQ(index.Rebuild(), 4);

    std::vector<std::string> paths;
    for (const auto& entry : index.Entries()) {
        paths.push_back(entry.path);
    }
    const std::vector<std::string> expected{"assets/logo.bin", "docs/api.md", "docs/guide.md", "main.py"};
    EXPECT_EQ(paths, expected);
    EXPECT_EQ(index.Entries()[0].type, "binary");
    EXPECT_EQ(index.Entries()[3].type, "text");
    EXPECT_EQ(index.Entries()[3].size, 12u);
    EXPECT_EQ(index.TotalBytes(), 8u + 6u + 8u + 12u);
}

TEST_F(FileIndexTest, ListFilesMatchesPathOrName) {
    FileIndex index(dir_.Path());
    index.Rebuild();

    const std::vector<std::string> markdown{"docs/api.md", "docs/guide.md"};
    EXPECT_EQ(index.ListFiles("*.md"), markdown);
    EXPECT_EQ(index.ListFiles("guide.md"), std::vector<std::string>{"docs/guide.md"});
    EXPECT_EQ(index.ListFiles("docs/*"), markdown);
    EXPECT_EQ(index.ListFiles("").size(), 4u);
    EXPECT_TRUE(index.ListFiles("*.rs").empty());
}

TEST_F(FileIndexTest, ReadFileStaysUnderRoot) {
    FileIndex index(dir_.Path());
    index.Rebuild();

    EXPECT_EQ(index.ReadFile("docs/guide.md"), std::optional<std::string>("# guide\n"));
    EXPECT_EQ(index.ReadFile("./main.py"), std::optional<std::string>("print('hi')\n"));
    EXPECT_FALSE(index.ReadFile("missing.txt").has_value());
    EXPECT_FALSE(index.ReadFile("docs").has_value());
    EXPECT_FALSE(index.ReadFile("../etc/passwd").has_value());
    EXPECT_FALSE(index.ReadFile("/etc/passwd").has_value());
}

TEST_F(FileIndexTest, SummaryIsCapped) {
    FileIndex index(dir_.Path());
    index.Rebuild();

    const auto full = index.Summary(50, 4000);
    EXPECT_EQ(full.rfind("Available files (4 total):\n", 0), 0u);
    EXPECT_NE(full.find("- main.py (12 bytes, text)"), std::string::npos);
    EXPECT_EQ(full.find("more"), std::string::npos);

    const auto capped = index.Summary(2, 4000);
    EXPECT_NE(capped.find("... and 2 more"), std::string::npos);
    EXPECT_EQ(capped.find("main.py"), std::string::npos);
}

TEST_F(FileIndexTest, ReindexSeesNewFiles) {
    FileIndex index(dir_.Path());
    index.Rebuild();
    dir_.Write("later.txt", "new\n");
    EXPECT_EQ(index.Rebuild(), 5);
}

TEST(FileIndexStandaloneTest, MissingRootIsEmpty) {
    FileIndex index("/nonexistent/rlm/data");
    EXPECT_EQ(index.Rebuild(), 0);
    EXPECT_TRUE(index.Empty());
    EXPECT_EQ(index.Summary(50, 4000), "");
    EXPECT_FALSE(index.ReadFile("x").has_value());

    FileIndex unset;
    EXPECT_FALSE(unset.ReadFile("x").has_value());
}

TEST(ClassifyFileTest, DetectsNulBytes) {
    TempDir dir("rlm_classify");
    EXPECT_EQ(ClassifyFile(dir.Write("a.txt", "plain text")), "text");
    EXPECT_EQ(ClassifyFile(dir.Write("b.dat", std::string("ab\0cd", 5))), "binary");
    EXPECT_EQ(ClassifyFile(dir.Path() / "missing"), "unknown");
}

}  // namespace
