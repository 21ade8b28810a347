/**
 * @file result_interpreter.hpp
 * @brief Classification of a RawOutcome into an ExecutionResult.
 *
 * Rules, first match wins:
 *   1. timed out            -> signal "terminated", no code
 *   2. OOM-killed           -> signal "killed", no code (raw code ignored)
 *   3. exit code 128 + N    -> signal name of N, no code
 *   4. otherwise            -> raw exit code, no signal
 *
 * Output is passed through untouched; nothing is appended to stderr.
 */

#pragma once

#include "core/types.hpp"
#include "lifecycle/container_controller.hpp"

#include <optional>
#include <string>

namespace codebox {

/// Exit codes above this mean "killed by signal (code - 128)".
inline constexpr int64_t kSignalExitBase = 128;

/// "SIGSEGV" for 11, "SIG<n>" for numbers without a name.
[[nodiscard]] std::string signal_name(int signal_number);

/// Signal number encoded in a container exit code, if any.
[[nodiscard]] std::optional<int> signal_from_exit_code(int64_t exit_code) noexcept;

[[nodiscard]] ExecutionResult classify(const RawOutcome& raw);

/// classify() plus language/version stamping.
[[nodiscard]] ExecutionResult classify(const RawOutcome& raw, const RuntimeDescriptor& runtime);

}  // namespace codebox
