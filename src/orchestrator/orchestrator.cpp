/**
 * @file orchestrator.cpp
 * @brief Orchestrator implementation.
 */

#include "orchestrator/orchestrator.hpp"

#include "interpreter/result_interpreter.hpp"
#include "lifecycle/resource_profile.hpp"
#include "runtime/command_builder.hpp"
#include "telemetry/json_sink.hpp"
#include "workspace/file_set.hpp"

#include <algorithm>

namespace codebox {

namespace {

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

}  // anonymous namespace

bool image_available(const std::string& image, const std::vector<std::string>& tags) {
    // A ':' after the last '/' is a tag; before it, a registry port.
    const auto slash = image.rfind('/');
    const auto colon = image.rfind(':');
    const bool tagged = colon != std::string::npos && (slash == std::string::npos || colon > slash);
    const std::string wanted = tagged ? image : image + ":latest";
    return std::find(tags.begin(), tags.end(), wanted) != tags.end();
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<std::unique_ptr<Orchestrator>> Orchestrator::create(Options opts) {
    if (!opts.engine) {
        return Error{ErrorCode::Internal, "Orchestrator needs a container engine"};
    }
    if (auto valid = validate_config(opts.config); !valid) return valid.error();

    auto registry = RuntimeRegistry::create(
        RuntimeRegistry::merge(RuntimeRegistry::builtin_runtimes(), opts.config.runtimes),
        opts.config.limits.min_memory_mb * kMiB);
    if (!registry) return registry.error();

    return std::make_unique<Orchestrator>(PrivateTag{}, std::move(opts), std::move(*registry));
}

Orchestrator::Orchestrator(PrivateTag, Options opts, RuntimeRegistry registry)
    : config_(std::move(opts.config))
    , logger_(or_null_sink(std::move(opts.log_sink)), opts.log_level)
    , metrics_(or_null_sink(std::move(opts.metrics_sink)))
    , engine_(std::move(opts.engine))
    , registry_(std::move(registry))
    , workspaces_(config_.staging.root,
                  [this](const Workspace& ws, const Error& error) {
                      logger_.warn("Workspace cleanup failed", {
                          {"workspace", ws.id},
                          {"path", ws.path.string()},
                          {"error", error.message}
                      });
                      metrics_.record_cleanup_failure("workspace", ws.id, error);
                  })
    , admission_(config_.limits.max_concurrent_jobs)
    , controller_(*engine_, config_.sandbox, &logger_,
                  [this](const ContainerId& id, const Error& error) {
                      metrics_.record_cleanup_failure("container", id, error);
                  })
    , pool_(std::max<size_t>(config_.limits.max_concurrent_jobs, 1),
            std::max<size_t>(config_.limits.max_concurrent_jobs, 1)) {}

Orchestrator::~Orchestrator() {
    logger_.flush();
    metrics_.flush();
}

Result<void> Orchestrator::start() {
    if (config_.staging.verify_root) {
        if (auto ok = workspaces_.verify_staging_root(); !ok) {
            logger_.error("Staging root rejected", {
                {"root", workspaces_.root().string()},
                {"error", ok.error().message}
            });
            return ok;
        }
    }

    if (auto ok = engine_->ping(); !ok) {
        logger_.error("Container engine unreachable", {
            {"endpoint", config_.engine.endpoint},
            {"error", ok.error().message}
        });
        return Error{ErrorCode::EngineUnavailable, ok.error().message};
    }

    logger_.info("Orchestrator started", {
        {"runtimes", std::to_string(registry_.size())},
        {"max_concurrent_jobs", std::to_string(admission_.capacity())},
        {"staging_root", workspaces_.root().string()}
    });
    return {};
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

std::string Orchestrator::next_execution_id() {
    return "exec-" + std::to_string(sequence_.fetch_add(1) + 1);
}

Result<ExecutionResult> Orchestrator::fail(const std::string& execution_id, Error error) {
    logger_.warn("Execution failed", {
        {"execution", execution_id},
        {"code", std::string(to_string(error.code))},
        {"error", error.message}
    });
    metrics_.record_execution_failed(execution_id, error);
    return error;
}

Result<ExecutionResult> Orchestrator::execute(const ExecutionRequest& request) {
    const auto execution_id = next_execution_id();

    // ── Validation: no slot, no engine call ──
    auto runtime = registry_.resolve(request.language, request.version);
    if (!runtime) {
        logger_.debug("Rejected request", {{"execution", execution_id},
                                           {"error", runtime.error().message}});
        return runtime.error();
    }
    if (auto args = validate_args(request.args); !args) {
        logger_.debug("Rejected request", {{"execution", execution_id},
                                           {"error", args.error().message}});
        return args.error();
    }
    auto files = prepare_files(request.files, *runtime);
    if (!files) {
        logger_.debug("Rejected request", {{"execution", execution_id},
                                           {"error", files.error().message}});
        return files.error();
    }
    auto profile = make_resource_profile(request, *runtime, config_.limits);
    if (!profile) {
        logger_.debug("Rejected request", {{"execution", execution_id},
                                           {"error", profile.error().message}});
        return profile.error();
    }

    // ── Admitted work ────────────────────────
    auto permit = admission_.acquire();
    metrics_.record_execution_started(execution_id, runtime->language, runtime->version);
    logger_.debug("Execution admitted", {
        {"execution", execution_id},
        {"language", runtime->language},
        {"version", runtime->version},
        {"in_flight", std::to_string(admission_.in_flight())}
    });

    auto staged = workspaces_.stage(*files);
    if (!staged) return fail(execution_id, staged.error());
    WorkspaceLease lease(workspaces_, std::move(*staged));

    auto raw = controller_.run(*runtime, lease.get(), request.stdin_data, request.args,
                               *profile, files->front().data);
    if (!raw) return fail(execution_id, raw.error());

    auto result = classify(*raw, *runtime);

    // Destroy before the slot is returned; failures reach the cleanup observer.
    (void)lease.release();
    permit.release();

    metrics_.record_execution_finished(execution_id, result);
    logger_.info("Execution finished", {
        {"execution", execution_id},
        {"language", result.language},
        {"code", result.exit_code ? std::to_string(*result.exit_code) : "null"},
        {"signal", result.signal.value_or("null")},
        {"wall_ms", std::to_string(result.wall_time.count())}
    });
    return result;
}

std::future<Result<ExecutionResult>> Orchestrator::submit(ExecutionRequest request) {
    return pool_.submit([this, request = std::move(request)]() {
        return execute(request);
    });
}

// ─────────────────────────────────────────────
// Catalog / Health
// ─────────────────────────────────────────────

Result<std::vector<RuntimeDescriptor>> Orchestrator::list_runtimes(bool only_available) {
    if (!only_available) return registry_.list();

    auto tags = engine_->list_images();
    if (!tags) return tags.error();

    std::vector<RuntimeDescriptor> available;
    for (const auto& runtime : registry_.list()) {
        if (image_available(runtime.image, *tags)) available.push_back(runtime);
    }
    return available;
}

Result<void> Orchestrator::ping() {
    return engine_->ping();
}

}  // namespace codebox
