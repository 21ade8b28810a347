/**
 * @file resource_profile.hpp
 * @brief Server-side clamping of caller-supplied resource limits.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace codebox {

/**
 * @brief Effective limits for one container, after clamping.
 */
struct ResourceProfile {
    uint64_t memory_bytes{0};
    Duration run_timeout{0};
    Duration compile_timeout{0};
    int64_t nano_cpus{0};
    int64_t pids_limit{0};
    uint64_t tmpfs_bytes{0};
    size_t output_limit{0};

    /// How long to wait for the container: compile + run for compiled runtimes.
    [[nodiscard]] Duration wait_budget(bool compiled) const noexcept {
        return compiled ? compile_timeout + run_timeout : run_timeout;
    }
};

/**
 * @brief Clamp one requested value against a default and a maximum.
 *
 * std::nullopt and -1 select @p fallback. Zero and other negatives are
 * InvalidRequest. Anything above @p maximum is capped silently.
 */
Result<int64_t> clamp_limit(std::optional<int64_t> requested, int64_t fallback,
                            int64_t maximum, const char* field);

/**
 * @brief Build the profile for @p request on @p runtime.
 *
 * Runtime limits may only tighten the [limits] configuration. Memory is
 * raised to the configured floor.
 */
Result<ResourceProfile> make_resource_profile(const ExecutionRequest& request,
                                              const RuntimeDescriptor& runtime,
                                              const LimitsConfig& limits);

}  // namespace codebox
