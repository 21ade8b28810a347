/**
 * @file container_controller.hpp
 * @brief Drives one sandboxed container from create to forced remove.
 *
 * Language-agnostic: everything runtime-specific arrives through the
 * RuntimeDescriptor's image and command template.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/container_engine.hpp"
#include "lifecycle/resource_profile.hpp"
#include "workspace/workspace_manager.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codebox {

/**
 * @brief What the engine reported, before classification.
 */
struct RawOutcome {
    ContainerId container_id;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated{false};
    bool stderr_truncated{false};

    std::optional<int64_t> exit_code;  ///< Unset when the container was cut off
    bool timed_out{false};
    bool oom_killed{false};

    Duration elapsed{0};
};

/// Invoked when a container could not be removed.
using ContainerCleanupObserver = std::function<void(const ContainerId&, const Error&)>;

/**
 * @brief Forced-removes a container when it goes out of scope.
 *
 * Removal failures go to the observer; they never reach the caller.
 */
class ContainerGuard {
public:
    ContainerGuard(IContainerEngine& engine, ContainerId id, const ContainerCleanupObserver& observer);
    ~ContainerGuard();

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

    [[nodiscard]] const ContainerId& id() const noexcept { return id_; }

    /// Remove now. Returns false when removal failed (already reported).
    bool release();

private:
    IContainerEngine& engine_;
    ContainerId id_;
    const ContainerCleanupObserver& observer_;
    bool released_{false};
};

class ContainerController {
public:
    ContainerController(IContainerEngine& engine, SandboxConfig sandbox,
                        Logger* logger = nullptr, ContainerCleanupObserver observer = {});

    ContainerController(const ContainerController&) = delete;
    ContainerController& operator=(const ContainerController&) = delete;

    /**
     * @brief Run @p runtime over @p workspace.
     *
     * Creates the container, starts it, feeds stdin, waits up to the
     * profile's budget, collects output and status, and always finishes with
     * a forced remove. @p entry_source is only read for {classname}.
     *
     * Errors are engine failures; a program that times out, is OOM-killed or
     * exits non-zero is a successful RawOutcome.
     */
    Result<RawOutcome> run(const RuntimeDescriptor& runtime,
                           const Workspace& workspace,
                           std::string_view stdin_data,
                           const std::vector<std::string>& args,
                           const ResourceProfile& profile,
                           std::string_view entry_source = {});

    /// Container definition for one run; no engine call.
    [[nodiscard]] ContainerSpec make_spec(const RuntimeDescriptor& runtime,
                                          const Workspace& workspace,
                                          const std::vector<std::string>& args,
                                          const ResourceProfile& profile,
                                          std::string_view entry_source,
                                          bool open_stdin) const;

private:
    void report_cleanup(const ContainerId& id, const Error& error);

    IContainerEngine& engine_;
    SandboxConfig sandbox_;
    Logger* logger_;
    ContainerCleanupObserver observer_;
    ContainerCleanupObserver guard_observer_;
};

}  // namespace codebox
