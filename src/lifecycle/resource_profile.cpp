/**
 * @file resource_profile.cpp
 * @brief Resource-limit clamping.
 */

#include "lifecycle/resource_profile.hpp"

#include <algorithm>
#include <string>

namespace codebox {

Result<int64_t> clamp_limit(std::optional<int64_t> requested, int64_t fallback,
                            int64_t maximum, const char* field) {
    if (!requested.has_value() || *requested == -1) {
        return std::min(fallback, maximum);
    }
    if (*requested <= 0) {
        return Error{ErrorCode::InvalidRequest,
                     std::string(field) + " must be positive or -1, got " + std::to_string(*requested)};
    }
    return std::min(*requested, maximum);
}

Result<ResourceProfile> make_resource_profile(const ExecutionRequest& request,
                                              const RuntimeDescriptor& runtime,
                                              const LimitsConfig& limits) {
    const auto& rl = runtime.limits;

    // Memory
    int64_t max_memory = static_cast<int64_t>(limits.max_memory_mb * kMiB);
    if (rl.max_memory_bytes) {
        max_memory = std::min(max_memory, static_cast<int64_t>(*rl.max_memory_bytes));
    }
    int64_t default_memory = rl.default_memory_bytes
        ? static_cast<int64_t>(*rl.default_memory_bytes)
        : static_cast<int64_t>(limits.default_memory_mb * kMiB);

    auto memory = clamp_limit(request.memory_limit_bytes, default_memory, max_memory,
                              "run_memory_limit");
    if (!memory) return memory.error();

    // Run timeout
    int64_t max_run = limits.max_run_timeout_ms;
    if (rl.max_timeout) max_run = std::min<int64_t>(max_run, rl.max_timeout->count());
    int64_t default_run = rl.default_timeout ? rl.default_timeout->count()
                                             : int64_t{limits.default_run_timeout_ms};

    auto run = clamp_limit(request.run_timeout_ms, default_run, max_run, "run_timeout");
    if (!run) return run.error();

    // Compile timeout only matters for compiled runtimes but is validated always.
    auto compile = clamp_limit(request.compile_timeout_ms, limits.default_compile_timeout_ms,
                               limits.max_compile_timeout_ms, "compile_timeout");
    if (!compile) return compile.error();

    const auto floor = static_cast<int64_t>(limits.min_memory_mb * kMiB);

    ResourceProfile profile;
    profile.memory_bytes = static_cast<uint64_t>(std::max(*memory, floor));
    profile.run_timeout = Duration{*run};
    profile.compile_timeout = Duration{*compile};
    profile.nano_cpus = limits.nano_cpus;
    profile.pids_limit = limits.pids_limit;
    profile.tmpfs_bytes = limits.tmpfs_size_mb * kMiB;
    profile.output_limit = static_cast<size_t>(limits.output_limit_bytes);
    return profile;
}

}  // namespace codebox
