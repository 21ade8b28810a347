/**
 * @file container_engine.hpp
 * @brief The narrow container-engine control API codebox relies on.
 *
 * The engine is reached through an allow-listing intermediary. Only the
 * operations below may be assumed; there is no exec, kill, stop, network or
 * volume management. Termination of a running container happens through
 * remove() (forced).
 *
 * Virtual dispatch is fine here: every call is a blocking network round trip.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codebox {

/**
 * @brief Everything needed to create one sandboxed container.
 */
struct ContainerSpec {
    std::string image;
    std::vector<std::string> command;   ///< argv; never passed through a shell by codebox
    std::string working_dir;
    std::string user;

    std::filesystem::path host_path;    ///< Workspace directory on the host
    std::string mount_path;             ///< Where it appears in the sandbox
    bool mount_read_only{true};

    uint64_t memory_bytes{0};
    uint64_t memory_swap_bytes{0};      ///< Equal to memory_bytes: no swap headroom
    int64_t nano_cpus{0};
    int64_t pids_limit{0};

    bool network_disabled{true};
    bool read_only_rootfs{true};
    std::vector<std::string> cap_drop;
    std::vector<std::string> security_opt;
    std::vector<std::pair<std::string, std::string>> tmpfs;  ///< path -> mount options

    bool open_stdin{false};
    std::map<std::string, std::string> labels;
};

struct WaitStatus {
    bool timed_out{false};
    int64_t status_code{0};
};

/**
 * @brief Terminal state as reported by inspect.
 */
struct ContainerStatus {
    bool running{false};
    int64_t exit_code{0};
    bool oom_killed{false};
    std::string status;   ///< Engine's state string ("exited", "running", ...)
    std::string error;
};

enum class LogStream : uint8_t {
    Stdout = 1,
    Stderr = 2
};

/**
 * @brief One captured output stream, cut at the capture ceiling.
 */
struct StreamCapture {
    std::string data;
    bool truncated{false};
};

class IContainerEngine {
public:
    virtual ~IContainerEngine() = default;

    virtual Result<void> ping() = 0;
    /// Repository tags of every local image ("name:tag").
    virtual Result<std::vector<std::string>> list_images() = 0;

    virtual Result<ContainerId> create(const ContainerSpec& spec) = 0;
    virtual Result<void> start(const ContainerId& id) = 0;
    /// Deliver @p data on the container's stdin, then close it, within @p timeout.
    virtual Result<void> write_stdin(const ContainerId& id, std::string_view data,
                                     Duration timeout) = 0;
    /// Block until the container stops or @p timeout elapses (timed_out = true).
    virtual Result<WaitStatus> wait(const ContainerId& id, Duration timeout) = 0;
    /// Output of one stream so far, at most @p limit bytes.
    virtual Result<StreamCapture> logs(const ContainerId& id, LogStream stream, size_t limit) = 0;
    virtual Result<ContainerStatus> inspect(const ContainerId& id) = 0;
    /// Forced remove; kills a running container. Removing a missing container succeeds.
    virtual Result<void> remove(const ContainerId& id) = 0;
};

}  // namespace codebox
