/**
 * @file filesystem_diff_tracker.cpp
 * @brief Workspace snapshotting and change classification
 *
 * @date 2025
 */

#include "bastion/monitors/filesystem_diff_tracker.hpp"
#include "bastion/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace bastion {
namespace monitors {

FilesystemDiffTracker::FilesystemDiffTracker()
    : FilesystemDiffTracker(Config{}) {
}

FilesystemDiffTracker::FilesystemDiffTracker(Config config)
    : config_(std::move(config)) {
}

WorkspaceSnapshot FilesystemDiffTracker::Snapshot(const std::filesystem::path& root) const {
    WorkspaceSnapshot snapshot;
    snapshot.root = root;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        spdlog::debug("Snapshot root {} is not a directory", root.string());
        return snapshot;
    }

    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Error scanning {}: {}", root.string(), ec.message());
        return snapshot;
    }

    for (const std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Error scanning {}: {}", root.string(), ec.message());
            break;
        }

        const auto& entry = *it;

        if (entry.is_symlink(ec)) {
            continue;
        }
        if (entry.is_directory(ec)) {
            if (config_.excluded_directories.count(entry.path().filename().string())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) {
            continue;
        }

        FileFingerprint fingerprint;
        fingerprint.size = entry.file_size(ec);
        if (ec) {
            spdlog::warn("Cannot stat {}: {}", entry.path().string(), ec.message());
            ec.clear();
            continue;
        }
        fingerprint.modified_time = entry.last_write_time(ec);
        if (ec) {
            ec.clear();
        }

        if (config_.hash_contents && fingerprint.size <= config_.max_file_size_for_hash) {
            try {
                fingerprint.sha256 = utils::HashUtils::ComputeSHA256(entry.path());
            }
            catch (const std::exception& e) {
                spdlog::debug("Failed to hash {}: {}", entry.path().string(), e.what());
            }
        }

        snapshot.files.emplace(entry.path().lexically_relative(root), std::move(fingerprint));
    }

    spdlog::debug("Snapshot of {}: {} files", root.string(), snapshot.files.size());
    return snapshot;
}

WorkspaceDiff FilesystemDiffTracker::Diff(const WorkspaceSnapshot& before,
                                          const WorkspaceSnapshot& after) const {
    WorkspaceDiff diff;

    for (const auto& [path, fingerprint] : after.files) {
        auto previous = before.files.find(path);
        if (previous == before.files.end()) {
            diff.created.push_back(path);
        } else if (IsModified(previous->second, fingerprint)) {
            diff.modified.push_back(path);
        }
    }

    for (const auto& [path, fingerprint] : before.files) {
        if (!after.files.count(path)) {
            diff.deleted.push_back(path);
        }
    }

    return diff;
}

bool FilesystemDiffTracker::IsModified(const FileFingerprint& before,
                                       const FileFingerprint& after) const {
    if (before.size != after.size) {
        return true;
    }
    if (before.modified_time == after.modified_time) {
        return false;
    }
    // Timestamp moved; trust the content hash when both sides have one
    if (before.sha256 && after.sha256) {
        return *before.sha256 != *after.sha256;
    }
    return true;
}

} // namespace monitors
} // namespace bastion
