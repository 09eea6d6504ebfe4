#include "bastion/utils/hash_utils.hpp"
#include "bastion/utils/scoped_temp_dir.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using bastion::utils::HashUtils;
using bastion::utils::ScopedTempDir;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

} // namespace

TEST(HashUtilsTest, KnownFileDigests) {
    ScopedTempDir dir;
    dir.CreateUnderPath(fs::temp_directory_path(), "bastion-hash-test-");
    WriteFile(dir.GetPath() / "empty.txt", "");
    WriteFile(dir.GetPath() / "abc.txt", "abc");

    EXPECT_EQ(HashUtils::ComputeSHA256(dir.GetPath() / "empty.txt"),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(HashUtils::ComputeSHA256(dir.GetPath() / "abc.txt"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, LargeFileSpansMultipleChunks) {
    ScopedTempDir dir;
    dir.CreateUnderPath(fs::temp_directory_path(), "bastion-hash-test-");
    WriteFile(dir.GetPath() / "a.bin", std::string(20000, 'x'));
    WriteFile(dir.GetPath() / "b.bin", std::string(20000, 'x') + "y");

    auto digest = HashUtils::ComputeSHA256(dir.GetPath() / "a.bin");
    EXPECT_EQ(digest.size(), 64u);
    EXPECT_NE(digest, HashUtils::ComputeSHA256(dir.GetPath() / "b.bin"));
}

TEST(HashUtilsTest, MissingFileThrows) {
    EXPECT_THROW(HashUtils::ComputeSHA256(fs::path("/nonexistent/bastion/file")), std::runtime_error);
}

TEST(HashUtilsTest, SameContentComparison) {
    ScopedTempDir dir;
    dir.CreateUnderPath(fs::temp_directory_path(), "bastion-hash-test-");
    WriteFile(dir.GetPath() / "a", "same");
    WriteFile(dir.GetPath() / "b", "same");
    WriteFile(dir.GetPath() / "c", "diff");
    WriteFile(dir.GetPath() / "d", "longer content");

    EXPECT_TRUE(HashUtils::FilesHaveSameContent(dir.GetPath() / "a", dir.GetPath() / "b"));
    EXPECT_FALSE(HashUtils::FilesHaveSameContent(dir.GetPath() / "a", dir.GetPath() / "c"));
    EXPECT_FALSE(HashUtils::FilesHaveSameContent(dir.GetPath() / "a", dir.GetPath() / "d"));
}

TEST(ScopedTempDirTest, RemovedOnDestruction) {
    fs::path path;
    {
        ScopedTempDir dir;
        dir.CreateUnderPath(fs::temp_directory_path(), "bastion-scoped-");
        ASSERT_TRUE(dir.IsValid());
        path = dir.GetPath();
        WriteFile(path / "file.txt", "x");
        fs::create_directories(path / "nested" / "deeper");
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(ScopedTempDirTest, MoveTransfersOwnership) {
    ScopedTempDir first;
    first.CreateUnderPath(fs::temp_directory_path(), "bastion-scoped-");
    auto path = first.GetPath();

    ScopedTempDir second(std::move(first));
    EXPECT_FALSE(first.IsValid());
    EXPECT_EQ(second.GetPath(), path);
    EXPECT_TRUE(second.Delete());
    EXPECT_FALSE(fs::exists(path));
}
