/**
 * @file json_sink.hpp
 * @brief Log sink implementations: rotating NDJSON files, stderr, null.
 *
 * Sinks are not synchronized; Logger and MetricsCollector serialize writes.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace codebox {

/**
 * @brief Writes NDJSON to size-rotated files.
 *
 * The active file is <dir>/<prefix>.ndjson. On rotation it becomes
 * <prefix>.1.ndjson, older files shift up by one, and anything beyond
 * max_files is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path active_path() const;
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    /// Bytes instead of MiB; used by tests.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void open_active();
    void rotate_if_needed(size_t incoming);

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stderr, keeping stdout free for command output.
 */
class StderrSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output; used for benchmarks and tests.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace codebox
