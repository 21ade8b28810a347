/**
 * @file workspace_manager.hpp
 * @brief Per-request staging directories shared with the sandbox identity.
 *
 * The service identity writes files that the (different, unprivileged)
 * sandbox identity only reads through a read-only bind mount. Read access
 * for "other" is granted on exactly one freshly created, randomly named
 * directory and the files inside it; the staging root itself stays 0711 so
 * in-flight workspaces cannot be listed.
 *
 * Layout:
 *   <root>/                 0711, owned by the service uid
 *   <root>/ws-<32 hex>/     0755 once staged (0700 while writing)
 *   <root>/ws-<32 hex>/<f>  0644, fsync'ed before the container starts
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workspace/file_set.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace codebox {

struct Workspace {
    WorkspaceId id;
    std::filesystem::path path;   ///< Absolute
    uid_t owner_uid{0};
    gid_t owner_gid{0};
    std::vector<std::string> files;
};

/// Invoked when a workspace could not be removed.
using CleanupObserver = std::function<void(const Workspace&, const Error&)>;

class WorkspaceManager {
public:
    explicit WorkspaceManager(std::filesystem::path root, CleanupObserver observer = {});

    /**
     * @brief Ensure the staging root is private to this service.
     *
     * Creates the root (0711) when absent. Fails when it is a symlink, not a
     * directory, owned by another uid, or group/world-writable.
     */
    Result<void> verify_staging_root() const;

    /**
     * @brief Create a fresh workspace and write @p files into it durably.
     *
     * On failure any partially written directory is removed before returning
     * ErrorCode::StagingFailed.
     */
    Result<Workspace> stage(const std::vector<StagedFile>& files);

    /**
     * @brief Recursively remove a workspace. Idempotent.
     *
     * An already-absent directory is success. Failures are also reported to
     * the cleanup observer.
     */
    Result<void> destroy(const Workspace& workspace) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// 128 random bits as 32 lowercase hex digits.
    [[nodiscard]] static WorkspaceId generate_id();

private:
    Result<void> write_file(const std::filesystem::path& dir, const StagedFile& file) const;

    std::filesystem::path root_;
    CleanupObserver observer_;
};

/**
 * @brief Scoped ownership of a staged workspace.
 *
 * Destroys the workspace when it goes out of scope, whichever path the
 * request takes. Move-only.
 */
class WorkspaceLease {
public:
    WorkspaceLease(const WorkspaceManager& manager, Workspace workspace);
    ~WorkspaceLease();

    WorkspaceLease(WorkspaceLease&& other) noexcept;
    WorkspaceLease& operator=(WorkspaceLease&&) = delete;
    WorkspaceLease(const WorkspaceLease&) = delete;
    WorkspaceLease& operator=(const WorkspaceLease&) = delete;

    [[nodiscard]] const Workspace& get() const noexcept { return workspace_; }
    const Workspace* operator->() const noexcept { return &workspace_; }

    /// Destroy now instead of at scope exit.
    Result<void> release();

private:
    const WorkspaceManager* manager_;
    Workspace workspace_;
};

}  // namespace codebox
