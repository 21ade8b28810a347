/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>
#include <toml++/toml.hpp>

namespace codebox {

namespace {

/// Read a non-negative integer field; a present but malformed value is an error.
template <typename View, typename T>
void read_unsigned(View view, T& out, std::string_view key, std::vector<std::string>& errors) {
    if (!view) return;
    auto value = view.template value<int64_t>();
    if (!value || *value < 0) {
        errors.push_back(std::string{key} + " must be a non-negative integer");
        return;
    }
    out = static_cast<T>(*value);
}

template <typename View>
void read_strings(View view, std::vector<std::string>& out, std::string_view key,
                  std::vector<std::string>& errors) {
    if (!view) return;
    const auto* arr = view.as_array();
    if (!arr) {
        errors.push_back(std::string{key} + " must be an array of strings");
        return;
    }
    out.clear();
    for (const auto& element : *arr) {
        auto text = element.template value<std::string>();
        if (!text) {
            errors.push_back(std::string{key} + " must be an array of strings");
            return;
        }
        out.push_back(*text);
    }
}

Result<RuntimeDescriptor> parse_runtime(const toml::table& tbl, size_t index) {
    std::vector<std::string> errors;
    const std::string where = "runtime[" + std::to_string(index) + "]";

    RuntimeDescriptor rt;
    rt.language = tbl["language"].value_or(std::string{});
    rt.version = tbl["version"].value_or(std::string{});
    rt.image = tbl["image"].value_or(std::string{});
    rt.extension = tbl["extension"].value_or(std::string{});
    rt.compiled = tbl["compiled"].value_or(false);
    if (auto runtime = tbl["runtime"].value<std::string>()) {
        rt.runtime = *runtime;
    }
    read_strings(tbl["aliases"], rt.aliases, where + ".aliases", errors);
    read_strings(tbl["command"], rt.command, where + ".command", errors);

    uint64_t mb = 0;
    uint32_t ms = 0;
    if (tbl["default_memory_mb"]) {
        read_unsigned(tbl["default_memory_mb"], mb, where + ".default_memory_mb", errors);
        rt.limits.default_memory_bytes = mb * kMiB;
    }
    if (tbl["max_memory_mb"]) {
        read_unsigned(tbl["max_memory_mb"], mb, where + ".max_memory_mb", errors);
        rt.limits.max_memory_bytes = mb * kMiB;
    }
    if (tbl["default_timeout_ms"]) {
        read_unsigned(tbl["default_timeout_ms"], ms, where + ".default_timeout_ms", errors);
        rt.limits.default_timeout = Duration{ms};
    }
    if (tbl["max_timeout_ms"]) {
        read_unsigned(tbl["max_timeout_ms"], ms, where + ".max_timeout_ms", errors);
        rt.limits.max_timeout = Duration{ms};
    }

    if (rt.language.empty()) errors.push_back(where + ".language is required");
    if (rt.version.empty()) errors.push_back(where + ".version is required");
    if (rt.image.empty()) errors.push_back(where + ".image is required");
    if (rt.command.empty()) errors.push_back(where + ".command is required");

    if (!errors.empty()) {
        return Error{ErrorCode::InvalidRequest, errors.front()};
    }
    return rt;
}

template <typename T>
bool parse_env_number(const char* name, T& out, std::vector<std::string>& errors) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) return false;
    std::string_view text{raw};
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        errors.push_back(std::string{name} + " is not a valid number: " + std::string{text});
        return false;
    }
    out = value;
    return true;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;
        std::vector<std::string> errors;

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.endpoint = engine["endpoint"].value_or(config.engine.endpoint);
            config.engine.api_version = engine["api_version"].value_or(config.engine.api_version);
            read_unsigned(engine["connect_timeout_ms"], config.engine.connect_timeout_ms,
                          "engine.connect_timeout_ms", errors);
            read_unsigned(engine["request_timeout_ms"], config.engine.request_timeout_ms,
                          "engine.request_timeout_ms", errors);
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            auto& l = config.limits;
            read_unsigned(limits["default_memory_mb"], l.default_memory_mb, "limits.default_memory_mb", errors);
            read_unsigned(limits["max_memory_mb"], l.max_memory_mb, "limits.max_memory_mb", errors);
            read_unsigned(limits["min_memory_mb"], l.min_memory_mb, "limits.min_memory_mb", errors);
            read_unsigned(limits["default_run_timeout_ms"], l.default_run_timeout_ms,
                          "limits.default_run_timeout_ms", errors);
            read_unsigned(limits["max_run_timeout_ms"], l.max_run_timeout_ms,
                          "limits.max_run_timeout_ms", errors);
            read_unsigned(limits["default_compile_timeout_ms"], l.default_compile_timeout_ms,
                          "limits.default_compile_timeout_ms", errors);
            read_unsigned(limits["max_compile_timeout_ms"], l.max_compile_timeout_ms,
                          "limits.max_compile_timeout_ms", errors);
            read_unsigned(limits["max_concurrent_jobs"], l.max_concurrent_jobs,
                          "limits.max_concurrent_jobs", errors);
            read_unsigned(limits["pids_limit"], l.pids_limit, "limits.pids_limit", errors);
            read_unsigned(limits["nano_cpus"], l.nano_cpus, "limits.nano_cpus", errors);
            read_unsigned(limits["tmpfs_size_mb"], l.tmpfs_size_mb, "limits.tmpfs_size_mb", errors);
            read_unsigned(limits["output_limit_bytes"], l.output_limit_bytes,
                          "limits.output_limit_bytes", errors);
        }

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            auto& s = config.sandbox;
            s.network_disabled = sandbox["network_disabled"].value_or(s.network_disabled);
            s.read_only_rootfs = sandbox["read_only_rootfs"].value_or(s.read_only_rootfs);
            s.user = sandbox["user"].value_or(s.user);
            s.mount_path = sandbox["mount_path"].value_or(s.mount_path);
            read_strings(sandbox["cap_drop"], s.cap_drop, "sandbox.cap_drop", errors);
            read_strings(sandbox["security_opt"], s.security_opt, "sandbox.security_opt", errors);
            read_strings(sandbox["scratch_paths"], s.scratch_paths, "sandbox.scratch_paths", errors);
        }

        // [staging]
        if (auto staging = tbl["staging"]; staging.is_table()) {
            config.staging.root = staging["root"].value_or(config.staging.root.string());
            config.staging.verify_root = staging["verify_root"].value_or(config.staging.verify_root);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            read_unsigned(telemetry["max_file_size_mb"], config.telemetry.max_file_size_mb,
                          "telemetry.max_file_size_mb", errors);
            read_unsigned(telemetry["rotate_count"], config.telemetry.rotate_count,
                          "telemetry.rotate_count", errors);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        // [[runtime]]
        if (auto runtimes = tbl["runtime"]; runtimes) {
            const auto* arr = runtimes.as_array();
            if (!arr) {
                errors.emplace_back("runtime must be an array of tables ([[runtime]])");
            } else {
                for (size_t i = 0; i < arr->size(); ++i) {
                    const auto* entry = arr->get(i)->as_table();
                    if (!entry) {
                        errors.push_back("runtime[" + std::to_string(i) + "] must be a table");
                        continue;
                    }
                    auto rt = parse_runtime(*entry, i);
                    if (!rt) {
                        errors.push_back(rt.error().message);
                        continue;
                    }
                    config.runtimes.push_back(std::move(*rt));
                }
            }
        }

        if (!errors.empty()) {
            return Error{ErrorCode::InvalidRequest, "Invalid configuration: " + errors.front()};
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidRequest,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> apply_env_overrides(Config& config) {
    std::vector<std::string> errors;

    if (const char* endpoint = std::getenv("CODEBOX_ENGINE_ENDPOINT")) {
        config.engine.endpoint = endpoint;
    }
    if (const char* root = std::getenv("CODEBOX_STAGING_ROOT")) {
        config.staging.root = root;
    }
    if (const char* level = std::getenv("CODEBOX_LOG_LEVEL")) {
        config.telemetry.log_level = level;
    }

    parse_env_number("CODEBOX_MAX_CONCURRENT_JOBS", config.limits.max_concurrent_jobs, errors);
    parse_env_number("CODEBOX_DEFAULT_MEMORY_MB", config.limits.default_memory_mb, errors);
    parse_env_number("CODEBOX_MAX_MEMORY_MB", config.limits.max_memory_mb, errors);
    parse_env_number("CODEBOX_DEFAULT_TIMEOUT_MS", config.limits.default_run_timeout_ms, errors);
    parse_env_number("CODEBOX_MAX_TIMEOUT_MS", config.limits.max_run_timeout_ms, errors);

    if (!errors.empty()) {
        return Error{ErrorCode::InvalidRequest, errors.front()};
    }
    return {};
}

Result<void> validate_config(const Config& config) {
    const auto& l = config.limits;
    if (l.max_concurrent_jobs == 0) {
        return Error{ErrorCode::InvalidRequest, "limits.max_concurrent_jobs must be at least 1"};
    }
    if (l.min_memory_mb > l.max_memory_mb) {
        return Error{ErrorCode::InvalidRequest, "limits.min_memory_mb exceeds limits.max_memory_mb"};
    }
    if (l.default_memory_mb > l.max_memory_mb || l.default_memory_mb < l.min_memory_mb) {
        return Error{ErrorCode::InvalidRequest,
                     "limits.default_memory_mb must lie within [min_memory_mb, max_memory_mb]"};
    }
    if (l.default_run_timeout_ms == 0 || l.default_run_timeout_ms > l.max_run_timeout_ms) {
        return Error{ErrorCode::InvalidRequest,
                     "limits.default_run_timeout_ms must lie within (0, max_run_timeout_ms]"};
    }
    if (l.default_compile_timeout_ms > l.max_compile_timeout_ms) {
        return Error{ErrorCode::InvalidRequest,
                     "limits.default_compile_timeout_ms exceeds limits.max_compile_timeout_ms"};
    }
    if (l.output_limit_bytes == 0) {
        return Error{ErrorCode::InvalidRequest, "limits.output_limit_bytes must be positive"};
    }
    if (config.sandbox.mount_path.empty() || config.sandbox.mount_path.front() != '/') {
        return Error{ErrorCode::InvalidRequest, "sandbox.mount_path must be an absolute path"};
    }
    if (config.staging.root.empty() || !config.staging.root.is_absolute()) {
        return Error{ErrorCode::InvalidRequest, "staging.root must be an absolute path"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::InvalidRequest,
                     "telemetry.log_level must be one of debug, info, warn, error"};
    }
    return {};
}

}  // namespace codebox
