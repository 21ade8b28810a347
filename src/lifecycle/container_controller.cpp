/**
 * @file container_controller.cpp
 * @brief ContainerController implementation.
 */

#include "lifecycle/container_controller.hpp"

#include "runtime/command_builder.hpp"

#include <algorithm>
#include <chrono>

namespace codebox {

namespace {

Duration since(SteadyTime start) {
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// ContainerGuard
// ─────────────────────────────────────────────

ContainerGuard::ContainerGuard(IContainerEngine& engine, ContainerId id,
                               const ContainerCleanupObserver& observer)
    : engine_(engine), id_(std::move(id)), observer_(observer) {}

ContainerGuard::~ContainerGuard() {
    (void)release();
}

bool ContainerGuard::release() {
    if (released_) return true;
    released_ = true;

    auto removed = engine_.remove(id_);
    if (!removed) {
        if (observer_) observer_(id_, removed.error());
        return false;
    }
    return true;
}

// ─────────────────────────────────────────────
// ContainerController
// ─────────────────────────────────────────────

ContainerController::ContainerController(IContainerEngine& engine, SandboxConfig sandbox,
                                         Logger* logger, ContainerCleanupObserver observer)
    : engine_(engine)
    , sandbox_(std::move(sandbox))
    , logger_(logger)
    , observer_(std::move(observer))
    , guard_observer_([this](const ContainerId& id, const Error& error) {
          report_cleanup(id, error);
      }) {}

void ContainerController::report_cleanup(const ContainerId& id, const Error& error) {
    if (logger_ != nullptr) {
        logger_->warn("Container removal failed", {
            {"container", id},
            {"error", error.message}
        });
    }
    if (observer_) observer_(id, error);
}

ContainerSpec ContainerController::make_spec(const RuntimeDescriptor& runtime,
                                             const Workspace& workspace,
                                             const std::vector<std::string>& args,
                                             const ResourceProfile& profile,
                                             std::string_view entry_source,
                                             bool open_stdin) const {
    CommandContext ctx;
    ctx.mount_path = sandbox_.mount_path;
    ctx.entry_file = workspace.files.empty() ? std::string{} : workspace.files.front();
    ctx.entry_content = std::string(entry_source);
    ctx.args = args;

    ContainerSpec spec;
    spec.image = runtime.image;
    spec.command = build_command(runtime, ctx);
    spec.working_dir = sandbox_.mount_path;
    spec.user = sandbox_.user;

    spec.host_path = workspace.path;
    spec.mount_path = sandbox_.mount_path;
    spec.mount_read_only = true;

    spec.memory_bytes = profile.memory_bytes;
    spec.memory_swap_bytes = profile.memory_bytes;
    spec.nano_cpus = profile.nano_cpus;
    spec.pids_limit = profile.pids_limit;

    spec.network_disabled = sandbox_.network_disabled;
    spec.read_only_rootfs = sandbox_.read_only_rootfs;
    spec.cap_drop = sandbox_.cap_drop;
    spec.security_opt = sandbox_.security_opt;

    const std::string scratch = "rw,exec,nosuid,nodev,size=" + std::to_string(profile.tmpfs_bytes)
                              + ",mode=1777";
    for (const auto& path : sandbox_.scratch_paths) {
        spec.tmpfs.emplace_back(path, scratch);
    }

    spec.open_stdin = open_stdin;
    spec.labels = {
        {"codebox.workspace", workspace.id},
        {"codebox.language", runtime.language},
        {"codebox.version", runtime.version}
    };
    return spec;
}

Result<RawOutcome> ContainerController::run(const RuntimeDescriptor& runtime,
                                            const Workspace& workspace,
                                            std::string_view stdin_data,
                                            const std::vector<std::string>& args,
                                            const ResourceProfile& profile,
                                            std::string_view entry_source) {
    const auto started_at = std::chrono::steady_clock::now();

    auto spec = make_spec(runtime, workspace, args, profile, entry_source, !stdin_data.empty());
    auto created = engine_.create(spec);
    if (!created) return created.error();

    ContainerGuard guard(engine_, *created, guard_observer_);

    if (auto ok = engine_.start(guard.id()); !ok) return ok.error();
    const auto run_started = std::chrono::steady_clock::now();

    const auto budget = profile.wait_budget(runtime.compiled);

    if (!stdin_data.empty()) {
        // A program that exits without reading stdin closes the attach early.
        const auto stdin_budget = std::max(Duration{1}, budget - since(run_started));
        if (auto fed = engine_.write_stdin(guard.id(), stdin_data, stdin_budget);
            !fed && logger_ != nullptr) {
            logger_->warn("Could not deliver stdin", {
                {"container", guard.id()},
                {"error", fed.error().message}
            });
        }
    }

    const auto left = std::max(Duration{1}, budget - since(run_started));
    auto waited = engine_.wait(guard.id(), left);
    if (!waited) return waited.error();

    RawOutcome outcome;
    outcome.container_id = guard.id();
    outcome.timed_out = waited->timed_out;

    // Output first: a timed-out container is still running and loses it on remove.
    auto out = engine_.logs(guard.id(), LogStream::Stdout, profile.output_limit);
    if (!out) return out.error();
    auto err = engine_.logs(guard.id(), LogStream::Stderr, profile.output_limit);
    if (!err) return err.error();

    outcome.stdout_data = std::move(out->data);
    outcome.stdout_truncated = out->truncated;
    outcome.stderr_data = std::move(err->data);
    outcome.stderr_truncated = err->truncated;

    if (!outcome.timed_out) {
        auto status = engine_.inspect(guard.id());
        if (status) {
            outcome.exit_code = status->exit_code;
            outcome.oom_killed = status->oom_killed;
        } else {
            outcome.exit_code = waited->status_code;
            if (logger_ != nullptr) {
                logger_->warn("Inspect failed, using wait status", {
                    {"container", guard.id()},
                    {"error", status.error().message}
                });
            }
        }
    }

    (void)guard.release();
    outcome.elapsed = since(started_at);
    return outcome;
}

}  // namespace codebox
