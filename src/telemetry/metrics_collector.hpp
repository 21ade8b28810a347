/**
 * @file metrics_collector.hpp
 * @brief Execution telemetry: NDJSON events plus in-process counters.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

namespace codebox {

struct MetricsSnapshot {
    uint64_t started{0};
    uint64_t succeeded{0};         ///< Produced a classified result
    uint64_t failed{0};            ///< Ended with an Error
    uint64_t timed_out{0};
    uint64_t oom_killed{0};
    uint64_t cleanup_failures{0};  ///< Workspaces or containers left behind
};

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Counters are lock-free; event emission is serialized on the sink.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_execution_started(std::string_view execution_id,
                                  std::string_view language, std::string_view version);
    void record_execution_finished(std::string_view execution_id, const ExecutionResult& result);
    void record_execution_failed(std::string_view execution_id, const Error& error);
    /// @param resource  "workspace" or "container"
    void record_cleanup_failure(std::string_view resource, std::string_view id, const Error& error);
    void record_custom(std::string_view event, std::string_view json_payload);

    [[nodiscard]] MetricsSnapshot snapshot() const noexcept;

    void flush();

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    std::atomic<uint64_t> started_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint64_t> oom_killed_{0};
    std::atomic<uint64_t> cleanup_failures_{0};
};

}  // namespace codebox
