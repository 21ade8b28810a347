/**
 * @file config.hpp
 * @brief Service configuration with TOML deserialization.
 *
 * Precedence: built-in defaults, then the TOML file, then CODEBOX_*
 * environment variables.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace codebox {

struct EngineConfig {
    std::string endpoint = "unix:///var/run/docker.sock";  ///< unix:// or tcp://
    std::string api_version = "v1.43";
    uint32_t connect_timeout_ms = 5000;
    uint32_t request_timeout_ms = 30000;   ///< Per control-API call, except wait
};

struct LimitsConfig {
    uint64_t default_memory_mb = 128;
    uint64_t max_memory_mb = 256;
    uint64_t min_memory_mb = 16;

    uint32_t default_run_timeout_ms = 10000;
    uint32_t max_run_timeout_ms = 30000;
    uint32_t default_compile_timeout_ms = 10000;
    uint32_t max_compile_timeout_ms = 30000;

    uint32_t max_concurrent_jobs = 5;
    int64_t pids_limit = 64;
    int64_t nano_cpus = 500000000;         ///< 0.5 CPU
    uint64_t tmpfs_size_mb = 64;
    uint64_t output_limit_bytes = 1048576; ///< Capture ceiling per stream
};

struct SandboxConfig {
    bool network_disabled = true;
    bool read_only_rootfs = true;
    std::vector<std::string> cap_drop{"ALL"};
    std::vector<std::string> security_opt{"no-new-privileges:true"};
    std::string user = "runner";
    std::string mount_path = "/code";
    std::vector<std::string> scratch_paths{"/tmp", "/home/runner"};
};

struct StagingConfig {
    std::filesystem::path root = "/tmp/codebox";
    bool verify_root = true;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;          ///< Empty = stderr
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level service configuration.
 */
struct Config {
    EngineConfig engine;
    LimitsConfig limits;
    SandboxConfig sandbox;
    StagingConfig staging;
    TelemetryConfig telemetry;
    std::vector<RuntimeDescriptor> runtimes;  ///< [[runtime]] entries, merged over the built-ins
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Apply CODEBOX_* environment variables on top of @p config.
 *
 * Fails on a variable that is set but not parseable.
 */
Result<void> apply_env_overrides(Config& config);

/**
 * @brief Check cross-field consistency (defaults within maxima, etc).
 */
Result<void> validate_config(const Config& config);

}  // namespace codebox
