/**
 * @file filesystem_diff_tracker.hpp
 * @brief Before/after snapshots of a workspace and their differences
 *
 * Records path, size and modification time (plus an optional SHA-256) for
 * every regular file below a workspace root, then classifies changes
 * between two snapshots as created, modified or deleted.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bastion {
namespace monitors {

/**
 * @struct FileFingerprint
 * @brief Identity of one file at snapshot time
 */
struct FileFingerprint {
    std::uintmax_t size{0};
    std::filesystem::file_time_type modified_time{};
    std::optional<std::string> sha256;   ///< Only when content hashing is enabled
};

/**
 * @struct WorkspaceSnapshot
 * @brief Fingerprints keyed by path relative to the workspace root
 */
struct WorkspaceSnapshot {
    std::filesystem::path root;
    std::map<std::filesystem::path, FileFingerprint> files;
};

/**
 * @struct WorkspaceDiff
 * @brief Sorted, pairwise disjoint change sets (relative paths)
 */
struct WorkspaceDiff {
    std::vector<std::filesystem::path> created;
    std::vector<std::filesystem::path> modified;
    std::vector<std::filesystem::path> deleted;

    bool Empty() const { return created.empty() && modified.empty() && deleted.empty(); }
};

/**
 * @class FilesystemDiffTracker
 * @brief Stateless snapshot and diff engine
 *
 * A file counts as modified when its size or modification time changed.
 * With content hashing enabled, a timestamp-only change is confirmed
 * against the SHA-256 and ignored when the content is identical.
 *
 * **Usage Example**:
 * @code
 * FilesystemDiffTracker tracker;
 * auto before = tracker.Snapshot(workspace);
 * // ... run the command ...
 * auto diff = tracker.Diff(before, tracker.Snapshot(workspace));
 * @endcode
 */
class FilesystemDiffTracker {
public:
    struct Config {
        bool hash_contents{false};                          ///< Compute SHA-256 per file
        std::uintmax_t max_file_size_for_hash{10 * 1024 * 1024};  ///< Skip larger files
        std::set<std::string> excluded_directories;         ///< Directory names to skip (".git")
    };

    FilesystemDiffTracker();
    explicit FilesystemDiffTracker(Config config);

    /**
     * @brief Fingerprint every regular file below root
     *
     * Symlinks are not followed. Unreadable entries are skipped with a
     * warning. A missing root yields an empty snapshot.
     */
    WorkspaceSnapshot Snapshot(const std::filesystem::path& root) const;

    WorkspaceDiff Diff(const WorkspaceSnapshot& before, const WorkspaceSnapshot& after) const;

    const Config& GetConfig() const { return config_; }

private:
    bool IsModified(const FileFingerprint& before, const FileFingerprint& after) const;

    Config config_;
};

} // namespace monitors
} // namespace bastion
