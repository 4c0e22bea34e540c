#include <gtest/gtest.h>
#include "utils/file_utils.h"
#include <fstream>
#include <unistd.h>

using namespace nanoflow::utils;
namespace fs = std::filesystem;

class FileUtilsTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("nanoflow_file_utils_" + std::to_string(getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const fs::path& p, const std::string& content) {
        std::ofstream out(p, std::ios::binary);
        out << content;
    }
};

TEST_F(FileUtilsTest, IsDirectory) {
    EXPECT_TRUE(nanoflow::utils::is_directory(dir_));
    EXPECT_FALSE(nanoflow::utils::is_directory(dir_ / "nonexistent"));
    write(dir_ / "file.txt", "x");
    EXPECT_FALSE(nanoflow::utils::is_directory(dir_ / "file.txt"));
}

TEST_F(FileUtilsTest, EnsureDirectory) {
    EXPECT_TRUE(ensure_directory(dir_ / "a" / "b"));
    EXPECT_TRUE(fs::is_directory(dir_ / "a" / "b"));
    EXPECT_TRUE(ensure_directory(dir_ / "a" / "b"));

    write(dir_ / "plain", "x");
    EXPECT_FALSE(ensure_directory(dir_ / "plain"));
}

TEST_F(FileUtilsTest, IsNonemptyDirectory) {
    EXPECT_FALSE(is_nonempty_directory(dir_));
    write(dir_ / "reads.pod5", "x");
    EXPECT_TRUE(is_nonempty_directory(dir_));
    EXPECT_FALSE(is_nonempty_directory(dir_ / "reads.pod5"));
    EXPECT_FALSE(is_nonempty_directory(dir_ / "missing"));
}

TEST_F(FileUtilsTest, FileSize) {
    write(dir_ / "empty", "");
    write(dir_ / "five", "12345");
    EXPECT_EQ(nanoflow::utils::file_size(dir_ / "empty"), 0u);
    EXPECT_EQ(nanoflow::utils::file_size(dir_ / "five"), 5u);
    EXPECT_FALSE(nanoflow::utils::file_size(dir_ / "missing").has_value());
}

TEST_F(FileUtilsTest, RemovePath) {
    fs::create_directories(dir_ / "tree" / "sub");
    write(dir_ / "tree" / "sub" / "f", "x");
    EXPECT_GT(remove_path(dir_ / "tree"), 0u);
    EXPECT_FALSE(fs::exists(dir_ / "tree"));
    EXPECT_EQ(remove_path(dir_ / "tree"), 0u);
}

TEST_F(FileUtilsTest, ReadHeadLines) {
    write(dir_ / "reads.fastq", "@r1\r\nACGU\n+\nIIII\n@r2\n");
    auto lines = read_head_lines(dir_ / "reads.fastq", 4);
    ASSERT_EQ(lines.size(), 4);
    EXPECT_EQ(lines[0], "@r1");
    EXPECT_EQ(lines[3], "IIII");

    EXPECT_TRUE(read_head_lines(dir_ / "missing", 4).empty());
}

TEST_F(FileUtilsTest, ReadFile) {
    write(dir_ / "config.json", "{\"threads\": 8}");
    auto content = read_file(dir_ / "config.json");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "{\"threads\": 8}");
    EXPECT_FALSE(read_file(dir_ / "missing").has_value());
}
