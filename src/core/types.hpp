/**
 * @file types.hpp
 * @brief Fundamental types used throughout codebox.
 *
 * Defines the request/result vocabulary shared by the orchestrator, the
 * lifecycle controller and the request codec. All types are plain values.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codebox {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using WorkspaceId = std::string;
using ContainerId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

constexpr uint64_t kMiB = 1024ULL * 1024ULL;

// ─────────────────────────────────────────────
// Source Files
// ─────────────────────────────────────────────

enum class FileEncoding : uint8_t {
    Utf8,
    Base64,
    Hex
};

[[nodiscard]] constexpr std::string_view to_string(FileEncoding encoding) noexcept {
    switch (encoding) {
        case FileEncoding::Utf8:   return "utf8";
        case FileEncoding::Base64: return "base64";
        case FileEncoding::Hex:    return "hex";
    }
    return "unknown";
}

/**
 * @brief One caller-submitted file. An empty name is filled in at staging.
 */
struct SourceFile {
    std::string name;
    std::string content;
    FileEncoding encoding{FileEncoding::Utf8};
};

// ─────────────────────────────────────────────
// Execution Request
// ─────────────────────────────────────────────

/**
 * @brief A single execution as submitted by the request layer.
 *
 * Numeric limits are optional; std::nullopt (or -1 on the wire) selects the
 * configured default. They are clamped before any engine call.
 */
struct ExecutionRequest {
    std::string language;
    std::string version;
    std::vector<SourceFile> files;
    std::string stdin_data;
    std::vector<std::string> args;
    std::optional<int64_t> run_timeout_ms;
    std::optional<int64_t> compile_timeout_ms;
    std::optional<int64_t> memory_limit_bytes;
};

// ─────────────────────────────────────────────
// Execution Result
// ─────────────────────────────────────────────

/**
 * @brief Classified outcome of one execution.
 *
 * Exactly one of exit_code / signal is set. output is stdout followed by
 * stderr; it does not reflect the real interleaving.
 */
struct ExecutionResult {
    std::string language;
    std::string version;

    std::string stdout_data;
    std::string stderr_data;
    std::string output;

    std::optional<int> exit_code;
    std::optional<std::string> signal;

    bool stdout_truncated{false};
    bool stderr_truncated{false};
    bool timed_out{false};
    bool oom_killed{false};

    Duration wall_time{0};
};

// ─────────────────────────────────────────────
// Runtime Descriptor
// ─────────────────────────────────────────────

/**
 * @brief Per-runtime overrides of the global resource bounds.
 *
 * Unset fields fall back to the [limits] configuration. A runtime maximum
 * can only tighten the global maximum, never widen it.
 */
struct RuntimeLimits {
    std::optional<uint64_t> default_memory_bytes;
    std::optional<uint64_t> max_memory_bytes;
    std::optional<Duration> default_timeout;
    std::optional<Duration> max_timeout;
};

/**
 * @brief Static record identifying one executable language/version.
 *
 * command is an argument vector template. Placeholders:
 *   {file}      entry file path inside the sandbox
 *   {classname} public class of the entry file (Java)
 *   {args}      caller arguments, spliced as separate elements
 */
struct RuntimeDescriptor {
    std::string language;
    std::string version;
    std::vector<std::string> aliases;
    std::string image;
    std::string extension;
    bool compiled{false};
    std::vector<std::string> command;
    std::optional<std::string> runtime;
    RuntimeLimits limits;
};

// ─────────────────────────────────────────────
// Container State
// ─────────────────────────────────────────────

enum class ContainerState : uint8_t {
    Created,
    Started,
    Exited,
    TimedOut,
    Removed
};

[[nodiscard]] constexpr std::string_view to_string(ContainerState state) noexcept {
    switch (state) {
        case ContainerState::Created:  return "created";
        case ContainerState::Started:  return "started";
        case ContainerState::Exited:   return "exited";
        case ContainerState::TimedOut: return "timed_out";
        case ContainerState::Removed:  return "removed";
    }
    return "unknown";
}

}  // namespace codebox
