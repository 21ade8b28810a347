/**
 * @file result_interpreter.cpp
 * @brief Outcome classification.
 */

#include "interpreter/result_interpreter.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace codebox {

namespace {

// Linux numbering (x86-64 / aarch64).
constexpr std::array<std::pair<int, std::string_view>, 31> kSignalNames{{
    {1, "SIGHUP"},   {2, "SIGINT"},    {3, "SIGQUIT"},   {4, "SIGILL"},
    {5, "SIGTRAP"},  {6, "SIGABRT"},   {7, "SIGBUS"},    {8, "SIGFPE"},
    {9, "SIGKILL"},  {10, "SIGUSR1"},  {11, "SIGSEGV"},  {12, "SIGUSR2"},
    {13, "SIGPIPE"}, {14, "SIGALRM"},  {15, "SIGTERM"},  {16, "SIGSTKFLT"},
    {17, "SIGCHLD"}, {18, "SIGCONT"},  {19, "SIGSTOP"},  {20, "SIGTSTP"},
    {21, "SIGTTIN"}, {22, "SIGTTOU"},  {23, "SIGURG"},   {24, "SIGXCPU"},
    {25, "SIGXFSZ"}, {26, "SIGVTALRM"}, {27, "SIGPROF"}, {28, "SIGWINCH"},
    {29, "SIGIO"},   {30, "SIGPWR"},   {31, "SIGSYS"}
}};

// Highest real-time signal on Linux.
constexpr int kMaxSignal = 64;

}  // anonymous namespace

std::string signal_name(int signal_number) {
    for (const auto& [number, name] : kSignalNames) {
        if (number == signal_number) return std::string(name);
    }
    return "SIG" + std::to_string(signal_number);
}

std::optional<int> signal_from_exit_code(int64_t exit_code) noexcept {
    if (exit_code > kSignalExitBase && exit_code <= kSignalExitBase + kMaxSignal) {
        return static_cast<int>(exit_code - kSignalExitBase);
    }
    return std::nullopt;
}

ExecutionResult classify(const RawOutcome& raw) {
    ExecutionResult result;
    result.stdout_data = raw.stdout_data;
    result.stderr_data = raw.stderr_data;
    result.output = raw.stdout_data + raw.stderr_data;
    result.stdout_truncated = raw.stdout_truncated;
    result.stderr_truncated = raw.stderr_truncated;
    result.wall_time = raw.elapsed;

    if (raw.timed_out) {
        result.timed_out = true;
        result.signal = "terminated";
        return result;
    }
    if (raw.oom_killed) {
        result.oom_killed = true;
        result.signal = "killed";
        return result;
    }

    const int64_t code = raw.exit_code.value_or(0);
    if (auto sig = signal_from_exit_code(code)) {
        result.signal = signal_name(*sig);
        return result;
    }
    result.exit_code = static_cast<int>(code);
    return result;
}

ExecutionResult classify(const RawOutcome& raw, const RuntimeDescriptor& runtime) {
    auto result = classify(raw);
    result.language = runtime.language;
    result.version = runtime.version;
    return result;
}

}  // namespace codebox
