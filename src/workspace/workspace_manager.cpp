/**
 * @file workspace_manager.cpp
 * @brief WorkspaceManager implementation over POSIX file APIs.
 */

#include "workspace/workspace_manager.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <random>
#include <sys/stat.h>
#include <unistd.h>

namespace codebox {

namespace {

constexpr mode_t kRootMode = 0711;
constexpr mode_t kWritingMode = 0700;
constexpr mode_t kStagedDirMode = 0755;
constexpr mode_t kStagedFileMode = 0644;

Error staging_error(const std::string& what, int err) {
    return Error{ErrorCode::StagingFailed, what + ": " + std::strerror(err)};
}

/**
 * @brief fsync a directory so the entries written into it are durable.
 */
Result<void> sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return staging_error("open " + dir.string(), errno);
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        return staging_error("fsync " + dir.string(), err);
    }
    return {};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// WorkspaceManager
// ─────────────────────────────────────────────

WorkspaceManager::WorkspaceManager(std::filesystem::path root, CleanupObserver observer)
    : root_(root.lexically_normal()), observer_(std::move(observer)) {
    if (!root_.has_filename() && root_.has_parent_path()) {
        root_ = root_.parent_path();  // drop a trailing separator
    }
}

WorkspaceId WorkspaceManager::generate_id() {
    static constexpr char kHex[] = "0123456789abcdef";
    std::random_device rd;
    WorkspaceId id;
    id.reserve(32);
    for (int i = 0; i < 4; ++i) {
        uint32_t word = rd();
        for (int nibble = 0; nibble < 8; ++nibble) {
            id.push_back(kHex[word & 0xF]);
            word >>= 4;
        }
    }
    return id;
}

Result<void> WorkspaceManager::verify_staging_root() const {
    struct stat st{};
    if (::lstat(root_.c_str(), &st) != 0) {
        if (errno != ENOENT) {
            return staging_error("stat " + root_.string(), errno);
        }
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec) {
            return Error{ErrorCode::StagingFailed,
                         "create " + root_.string() + ": " + ec.message()};
        }
        if (::chmod(root_.c_str(), kRootMode) != 0) {
            return staging_error("chmod " + root_.string(), errno);
        }
        if (::lstat(root_.c_str(), &st) != 0) {
            return staging_error("stat " + root_.string(), errno);
        }
    }

    if (S_ISLNK(st.st_mode)) {
        return Error{ErrorCode::StagingFailed, "Staging root is a symlink: " + root_.string()};
    }
    if (!S_ISDIR(st.st_mode)) {
        return Error{ErrorCode::StagingFailed, "Staging root is not a directory: " + root_.string()};
    }
    if (st.st_uid != ::geteuid()) {
        return Error{ErrorCode::StagingFailed,
                     "Staging root is owned by uid " + std::to_string(st.st_uid)
                     + ", expected " + std::to_string(::geteuid())};
    }
    if ((st.st_mode & (S_IWGRP | S_IWOTH)) != 0) {
        return Error{ErrorCode::StagingFailed,
                     "Staging root is writable by other identities: " + root_.string()};
    }
    return {};
}

Result<Workspace> WorkspaceManager::stage(const std::vector<StagedFile>& files) {
    Workspace ws;
    ws.id = generate_id();
    ws.path = root_ / ("ws-" + ws.id);
    ws.owner_uid = ::geteuid();
    ws.owner_gid = ::getegid();

    if (::mkdir(ws.path.c_str(), kWritingMode) != 0) {
        return staging_error("mkdir " + ws.path.string(), errno);
    }

    auto fail = [&](Error err) -> Result<Workspace> {
        std::error_code ec;
        std::filesystem::remove_all(ws.path, ec);
        if (ec && observer_) {
            observer_(ws, Error{ErrorCode::StagingFailed, ec.message()});
        }
        return err;
    };

    for (const auto& file : files) {
        if (!is_safe_file_name(file.name)) {
            return fail(Error{ErrorCode::InvalidRequest, "Invalid file name: " + file.name});
        }
        if (auto written = write_file(ws.path, file); !written) {
            return fail(written.error());
        }
        ws.files.push_back(file.name);
    }

    // Open the subtree to the sandbox identity only after every file is durable.
    if (::chmod(ws.path.c_str(), kStagedDirMode) != 0) {
        return fail(staging_error("chmod " + ws.path.string(), errno));
    }
    if (auto synced = sync_directory(ws.path); !synced) {
        return fail(synced.error());
    }
    return ws;
}

Result<void> WorkspaceManager::write_file(const std::filesystem::path& dir,
                                          const StagedFile& file) const {
    const auto path = dir / file.name;
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd < 0) {
        return staging_error("create " + path.string(), errno);
    }

    const char* ptr = file.data.data();
    size_t remaining = file.data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return staging_error("write " + path.string(), err);
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::fchmod(fd, kStagedFileMode) != 0 || ::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return staging_error("sync " + path.string(), err);
    }
    if (::close(fd) != 0) {
        return staging_error("close " + path.string(), errno);
    }
    return {};
}

Result<void> WorkspaceManager::destroy(const Workspace& workspace) const {
    if (workspace.path.empty()) return {};

    // Never follow a path that escaped the staging root.
    if (workspace.path.parent_path() != root_) {
        Error err{ErrorCode::Internal, "Refusing to remove path outside staging root: "
                                       + workspace.path.string()};
        if (observer_) observer_(workspace, err);
        return err;
    }

    std::error_code ec;
    std::filesystem::remove_all(workspace.path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        Error err{ErrorCode::StagingFailed,
                  "remove " + workspace.path.string() + ": " + ec.message()};
        if (observer_) observer_(workspace, err);
        return err;
    }
    return {};
}

// ─────────────────────────────────────────────
// WorkspaceLease
// ─────────────────────────────────────────────

WorkspaceLease::WorkspaceLease(const WorkspaceManager& manager, Workspace workspace)
    : manager_(&manager), workspace_(std::move(workspace)) {}

WorkspaceLease::WorkspaceLease(WorkspaceLease&& other) noexcept
    : manager_(other.manager_), workspace_(std::move(other.workspace_)) {
    other.manager_ = nullptr;
}

WorkspaceLease::~WorkspaceLease() {
    // Failures reach the manager's cleanup observer.
    (void)release();
}

Result<void> WorkspaceLease::release() {
    if (manager_ == nullptr) return {};
    const auto* manager = manager_;
    manager_ = nullptr;
    return manager->destroy(workspace_);
}

}  // namespace codebox
