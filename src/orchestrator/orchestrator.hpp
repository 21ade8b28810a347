/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade: ties all modules together.
 *
 * One execution runs:
 *   resolve runtime, prepare files, clamp limits   (no slot, no engine call)
 *   acquire admission permit
 *   stage workspace -> run container -> classify
 *   destroy workspace, release permit
 * Every stage after admission is scoped, so a failure anywhere still
 * destroys the workspace and returns the permit before the error propagates.
 *
 * The container engine is injected, so tests drive the full pipeline with a
 * scripted fake.
 */

#pragma once

#include "admission/admission_controller.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/container_engine.hpp"
#include "executor/worker_pool.hpp"
#include "lifecycle/container_controller.hpp"
#include "runtime/registry.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workspace/workspace_manager.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace codebox {

class Orchestrator {
public:
    struct Options {
        Config config;
        std::unique_ptr<IContainerEngine> engine;
        std::unique_ptr<ILogSink> log_sink;
        std::unique_ptr<ILogSink> metrics_sink;   ///< NullSink when unset
        LogLevel log_level = LogLevel::Info;
    };

    /**
     * @brief Build the registry and wire every module.
     *
     * Fails on an invalid configuration or runtime catalog. Does not touch
     * the filesystem or the engine; see start().
     */
    static Result<std::unique_ptr<Orchestrator>> create(Options opts);

private:
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Reachable only through create().
    Orchestrator(PrivateTag, Options opts, RuntimeRegistry registry);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Verify the staging root (when configured) and ping the engine.
    Result<void> start();

    // ── Execution ────────────────────────────

    /**
     * @brief Run one request to completion on the calling thread.
     *
     * Blocks while all admission permits are held. Timeout, OOM and
     * non-zero exits are results, not errors.
     */
    Result<ExecutionResult> execute(const ExecutionRequest& request);

    /**
     * @brief execute() on the worker pool.
     *
     * At most max_concurrent_jobs submissions wait for a worker; beyond that
     * the caller is suspended until one is picked up.
     */
    std::future<Result<ExecutionResult>> submit(ExecutionRequest request);

    // ── Catalog / Health ─────────────────────

    /**
     * @brief Registered runtimes; with @p only_available, only those whose
     * image is present on the engine.
     */
    Result<std::vector<RuntimeDescriptor>> list_runtimes(bool only_available = false);

    Result<void> ping();

    // ── Accessors ────────────────────────────
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] const RuntimeRegistry& registry() const noexcept { return registry_; }
    AdmissionController& admission() noexcept { return admission_; }
    WorkspaceManager& workspaces() noexcept { return workspaces_; }
    MetricsCollector& metrics() noexcept { return metrics_; }
    Logger& logger() noexcept { return logger_; }
    [[nodiscard]] size_t queued_submissions() const { return pool_.queued_count(); }

private:
    std::string next_execution_id();
    Result<ExecutionResult> fail(const std::string& execution_id, Error error);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    std::unique_ptr<IContainerEngine> engine_;
    RuntimeRegistry registry_;
    WorkspaceManager workspaces_;
    AdmissionController admission_;
    ContainerController controller_;
    std::atomic<uint64_t> sequence_{0};

    // Last: destroyed first, so queued executions drain while the rest is alive.
    WorkerPool pool_;
};

/// True when @p image (implicitly ":latest" without a tag) is among @p tags.
[[nodiscard]] bool image_available(const std::string& image, const std::vector<std::string>& tags);

}  // namespace codebox
