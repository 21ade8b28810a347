/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace codebox {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_execution_started(std::string_view execution_id,
                                                std::string_view language,
                                                std::string_view version) {
    started_.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << R"({"event":"execution_started")"
        << R"(,"execution":")" << escape_json(execution_id) << "\""
        << R"(,"language":")" << escape_json(language) << "\""
        << R"(,"version":")" << escape_json(version) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_execution_finished(std::string_view execution_id,
                                                 const ExecutionResult& result) {
    succeeded_.fetch_add(1, std::memory_order_relaxed);
    if (result.timed_out) timed_out_.fetch_add(1, std::memory_order_relaxed);
    if (result.oom_killed) oom_killed_.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << R"({"event":"execution_finished")"
        << R"(,"execution":")" << escape_json(execution_id) << "\""
        << R"(,"language":")" << escape_json(result.language) << "\"";
    if (result.exit_code) {
        oss << R"(,"code":)" << *result.exit_code;
    } else {
        oss << R"(,"code":null)";
    }
    if (result.signal) {
        oss << R"(,"signal":")" << escape_json(*result.signal) << "\"";
    } else {
        oss << R"(,"signal":null)";
    }
    oss << R"(,"timed_out":)" << (result.timed_out ? "true" : "false")
        << R"(,"oom_killed":)" << (result.oom_killed ? "true" : "false")
        << R"(,"stdout_bytes":)" << result.stdout_data.size()
        << R"(,"stderr_bytes":)" << result.stderr_data.size()
        << R"(,"wall_ms":)" << result.wall_time.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_execution_failed(std::string_view execution_id, const Error& error) {
    failed_.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << R"({"event":"execution_failed")"
        << R"(,"execution":")" << escape_json(execution_id) << "\""
        << R"(,"code":")" << to_string(error.code) << "\""
        << R"(,"message":")" << escape_json(error.message) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_cleanup_failure(std::string_view resource, std::string_view id,
                                              const Error& error) {
    cleanup_failures_.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << R"({"event":"cleanup_failure")"
        << R"(,"resource":")" << escape_json(resource) << "\""
        << R"(,"id":")" << escape_json(id) << "\""
        << R"(,"message":")" << escape_json(error.message) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << escape_json(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

MetricsSnapshot MetricsCollector::snapshot() const noexcept {
    MetricsSnapshot snap;
    snap.started = started_.load(std::memory_order_relaxed);
    snap.succeeded = succeeded_.load(std::memory_order_relaxed);
    snap.failed = failed_.load(std::memory_order_relaxed);
    snap.timed_out = timed_out_.load(std::memory_order_relaxed);
    snap.oom_killed = oom_killed_.load(std::memory_order_relaxed);
    snap.cleanup_failures = cleanup_failures_.load(std::memory_order_relaxed);
    return snap;
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace codebox
