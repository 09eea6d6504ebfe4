#include "bastion/monitors/filesystem_diff_tracker.hpp"
#include "bastion/utils/scoped_temp_dir.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <fstream>

namespace fs = std::filesystem;
using namespace bastion::monitors;
using bastion::utils::ScopedTempDir;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

void BumpModifiedTime(const fs::path& path) {
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(5));
}

class FilesystemDiffTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        workspace_.CreateUnderPath(fs::temp_directory_path(), "bastion-diff-test-");
        ASSERT_TRUE(workspace_.IsValid());
        root_ = workspace_.GetPath();
    }

    ScopedTempDir workspace_;
    fs::path root_;
};

} // namespace

TEST_F(FilesystemDiffTrackerTest, ClassifiesCreatedModifiedDeleted) {
    WriteFile(root_ / "keep.txt", "unchanged");
    WriteFile(root_ / "edit.txt", "before");
    WriteFile(root_ / "gone.txt", "bye");

    FilesystemDiffTracker tracker;
    auto before = tracker.Snapshot(root_);
    ASSERT_EQ(before.files.size(), 3u);

    WriteFile(root_ / "edit.txt", "after, and longer");
    fs::remove(root_ / "gone.txt");
    WriteFile(root_ / "src" / "new.py", "print(1)");

    auto diff = tracker.Diff(before, tracker.Snapshot(root_));

    ASSERT_EQ(diff.created.size(), 1u);
    EXPECT_EQ(diff.created[0], fs::path("src") / "new.py");
    ASSERT_EQ(diff.modified.size(), 1u);
    EXPECT_EQ(diff.modified[0], fs::path("edit.txt"));
    ASSERT_EQ(diff.deleted.size(), 1u);
    EXPECT_EQ(diff.deleted[0], fs::path("gone.txt"));
}

TEST_F(FilesystemDiffTrackerTest, UnchangedWorkspaceHasEmptyDiff) {
    WriteFile(root_ / "a.txt", "a");
    WriteFile(root_ / "nested" / "b.txt", "b");

    FilesystemDiffTracker tracker;
    auto before = tracker.Snapshot(root_);
    auto diff = tracker.Diff(before, tracker.Snapshot(root_));

    EXPECT_TRUE(diff.Empty());
}

TEST_F(FilesystemDiffTrackerTest, ChangeSetsAreSortedAndDisjoint) {
    for (const char* name : {"m1", "m2", "d1", "d2"}) {
        WriteFile(root_ / name, "x");
    }

    FilesystemDiffTracker tracker;
    auto before = tracker.Snapshot(root_);

    WriteFile(root_ / "m2", "changed");
    WriteFile(root_ / "m1", "changed");
    fs::remove(root_ / "d2");
    fs::remove(root_ / "d1");
    WriteFile(root_ / "c2", "new");
    WriteFile(root_ / "c1", "new");

    auto diff = tracker.Diff(before, tracker.Snapshot(root_));

    EXPECT_TRUE(std::is_sorted(diff.created.begin(), diff.created.end()));
    EXPECT_TRUE(std::is_sorted(diff.modified.begin(), diff.modified.end()));
    EXPECT_TRUE(std::is_sorted(diff.deleted.begin(), diff.deleted.end()));
    EXPECT_EQ(diff.created.size(), 2u);
    EXPECT_EQ(diff.modified.size(), 2u);
    EXPECT_EQ(diff.deleted.size(), 2u);

    std::vector<fs::path> all;
    all.insert(all.end(), diff.created.begin(), diff.created.end());
    all.insert(all.end(), diff.modified.begin(), diff.modified.end());
    all.insert(all.end(), diff.deleted.begin(), diff.deleted.end());
    std::sort(all.begin(), all.end());
    EXPECT_EQ(std::adjacent_find(all.begin(), all.end()), all.end());
}

TEST_F(FilesystemDiffTrackerTest, ExcludedDirectoriesAreSkipped) {
    FilesystemDiffTracker::Config config;
    config.excluded_directories = {".git", "node_modules"};
    FilesystemDiffTracker tracker(config);

    auto before = tracker.Snapshot(root_);

    WriteFile(root_ / ".git" / "HEAD", "ref: refs/heads/main");
    WriteFile(root_ / "node_modules" / "pkg" / "index.js", "module.exports = 1;");
    WriteFile(root_ / "app.js", "require('pkg');");

    auto after = tracker.Snapshot(root_);
    auto diff = tracker.Diff(before, after);

    ASSERT_EQ(diff.created.size(), 1u);
    EXPECT_EQ(diff.created[0], fs::path("app.js"));
    EXPECT_EQ(after.files.size(), 1u);
}

TEST_F(FilesystemDiffTrackerTest, TimestampOnlyChangeIsModifiedWithoutHashing) {
    WriteFile(root_ / "touched.txt", "same content");

    FilesystemDiffTracker tracker;
    auto before = tracker.Snapshot(root_);
    BumpModifiedTime(root_ / "touched.txt");

    auto diff = tracker.Diff(before, tracker.Snapshot(root_));
    ASSERT_EQ(diff.modified.size(), 1u);
    EXPECT_EQ(diff.modified[0], fs::path("touched.txt"));
}

TEST_F(FilesystemDiffTrackerTest, ContentHashingIgnoresTimestampOnlyChange) {
    WriteFile(root_ / "touched.txt", "same content");
    WriteFile(root_ / "rewritten.txt", "abcd");

    FilesystemDiffTracker::Config config;
    config.hash_contents = true;
    FilesystemDiffTracker tracker(config);

    auto before = tracker.Snapshot(root_);
    ASSERT_TRUE(before.files.at("touched.txt").sha256.has_value());

    BumpModifiedTime(root_ / "touched.txt");
    WriteFile(root_ / "rewritten.txt", "wxyz");
    BumpModifiedTime(root_ / "rewritten.txt");

    auto diff = tracker.Diff(before, tracker.Snapshot(root_));
    ASSERT_EQ(diff.modified.size(), 1u);
    EXPECT_EQ(diff.modified[0], fs::path("rewritten.txt"));
}

TEST_F(FilesystemDiffTrackerTest, LargeFilesAreNotHashed) {
    WriteFile(root_ / "big.bin", std::string(4096, 'x'));

    FilesystemDiffTracker::Config config;
    config.hash_contents = true;
    config.max_file_size_for_hash = 1024;
    FilesystemDiffTracker tracker(config);

    auto snapshot = tracker.Snapshot(root_);
    ASSERT_EQ(snapshot.files.count("big.bin"), 1u);
    EXPECT_FALSE(snapshot.files.at("big.bin").sha256.has_value());
    EXPECT_EQ(snapshot.files.at("big.bin").size, 4096u);
}

TEST_F(FilesystemDiffTrackerTest, SymlinksAreNotFollowed) {
    WriteFile(root_ / "real.txt", "data");
    fs::create_symlink(root_ / "real.txt", root_ / "link.txt");

    FilesystemDiffTracker tracker;
    auto snapshot = tracker.Snapshot(root_);

    EXPECT_EQ(snapshot.files.count("real.txt"), 1u);
    EXPECT_EQ(snapshot.files.count("link.txt"), 0u);
}

TEST(FilesystemDiffTrackerStandaloneTest, MissingRootYieldsEmptySnapshot) {
    FilesystemDiffTracker tracker;
    auto snapshot = tracker.Snapshot("/nonexistent/bastion/workspace");
    EXPECT_TRUE(snapshot.files.empty());

    // Directory appears after the first snapshot: everything is created
    ScopedTempDir dir;
    dir.CreateUnderPath(fs::temp_directory_path(), "bastion-diff-test-");
    auto missing = dir.GetPath() / "later";
    auto before = tracker.Snapshot(missing);
    WriteFile(missing / "file.txt", "x");

    auto diff = tracker.Diff(before, tracker.Snapshot(missing));
    ASSERT_EQ(diff.created.size(), 1u);
    EXPECT_EQ(diff.created[0], fs::path("file.txt"));
}
