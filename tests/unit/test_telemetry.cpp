/**
 * @file test_telemetry.cpp
 * @brief Unit tests for MetricsCollector counters and JsonFileSink rotation.
 */

#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace codebox;

namespace fs = std::filesystem;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : lines_(std::move(lines)) {}
    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

std::vector<std::string> read_lines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    return lines;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// MetricsCollector
// ─────────────────────────────────────────────

TEST(MetricsCollectorTest, CountersFollowEvents) {
    auto lines = std::make_shared<std::vector<std::string>>();
    MetricsCollector metrics(std::make_unique<CaptureSink>(lines));

    metrics.record_execution_started("e1", "python", "3.12.0");
    metrics.record_execution_started("e2", "c", "13.2.0");
    metrics.record_execution_started("e3", "java", "21.0.0");

    ExecutionResult timed_out;
    timed_out.language = "python";
    timed_out.timed_out = true;
    timed_out.signal = "terminated";
    metrics.record_execution_finished("e1", timed_out);

    ExecutionResult oom;
    oom.language = "c";
    oom.oom_killed = true;
    oom.signal = "killed";
    metrics.record_execution_finished("e2", oom);

    metrics.record_execution_failed("e3", Error{ErrorCode::EngineUnavailable, "down"});
    metrics.record_cleanup_failure("container", "abc", Error{"still running"});

    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.started, 3u);
    EXPECT_EQ(snap.succeeded, 2u);
    EXPECT_EQ(snap.failed, 1u);
    EXPECT_EQ(snap.timed_out, 1u);
    EXPECT_EQ(snap.oom_killed, 1u);
    EXPECT_EQ(snap.cleanup_failures, 1u);
    EXPECT_EQ(lines->size(), 7u);
}

TEST(MetricsCollectorTest, EventsAreValidJson) {
    auto lines = std::make_shared<std::vector<std::string>>();
    MetricsCollector metrics(std::make_unique<CaptureSink>(lines));

    ExecutionResult result;
    result.language = "python";
    result.exit_code = 0;
    result.stdout_data = "line \"quoted\"\n";
    result.wall_time = Duration{15};
    metrics.record_execution_finished("e\t1", result);
    metrics.record_execution_failed("e2", Error{ErrorCode::InvalidRequest, "bad\nrequest"});
    metrics.record_custom("startup", R"({"runtimes":5})");

    ASSERT_EQ(lines->size(), 3u);

    auto finished = nlohmann::json::parse((*lines)[0]);
    EXPECT_EQ(finished["event"], "execution_finished");
    EXPECT_EQ(finished["execution"], "e\t1");
    EXPECT_EQ(finished["code"], 0);
    EXPECT_TRUE(finished["signal"].is_null());
    EXPECT_EQ(finished["stdout_bytes"], result.stdout_data.size());
    EXPECT_EQ(finished["wall_ms"], 15);

    auto failed = nlohmann::json::parse((*lines)[1]);
    EXPECT_EQ(failed["code"], "invalid_request");
    EXPECT_EQ(failed["message"], "bad\nrequest");

    auto custom = nlohmann::json::parse((*lines)[2]);
    EXPECT_EQ(custom["event"], "startup");
    EXPECT_EQ(custom["data"]["runtimes"], 5);
}

// ─────────────────────────────────────────────
// JsonFileSink
// ─────────────────────────────────────────────

class JsonFileSinkTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() / "codebox_test_sink";
        fs::remove_all(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
};

TEST_F(JsonFileSinkTest, WritesOneLinePerRecord) {
    {
        JsonFileSink sink(dir_, "events");
        sink.write(R"({"a":1})");
        sink.write(R"({"b":2})");
        sink.flush();
    }
    auto lines = read_lines(dir_ / "events.ndjson");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], R"({"a":1})");
    EXPECT_EQ(lines[1], R"({"b":2})");
}

TEST_F(JsonFileSinkTest, RotatesAndCapsFileCount) {
    JsonFileSink sink(dir_, "events", 1, 2);
    sink.set_max_file_size_bytes(16);

    // Each record is 10 bytes with its newline: one record per file.
    for (int i = 0; i < 4; ++i) {
        sink.write(R"({"n":)" + std::to_string(i) + "}  ");
    }
    sink.flush();

    EXPECT_TRUE(fs::exists(sink.active_path()));
    EXPECT_TRUE(fs::exists(sink.rotated_path(1)));
    EXPECT_TRUE(fs::exists(sink.rotated_path(2)));
    EXPECT_FALSE(fs::exists(sink.rotated_path(3)));

    EXPECT_EQ(read_lines(sink.active_path()).front(), R"({"n":3}  )");
    EXPECT_EQ(read_lines(sink.rotated_path(1)).front(), R"({"n":2}  )");
    EXPECT_EQ(read_lines(sink.rotated_path(2)).front(), R"({"n":1}  )");
}

TEST_F(JsonFileSinkTest, AppendsToExistingFile) {
    {
        JsonFileSink sink(dir_, "events");
        sink.write(R"({"first":true})");
    }
    {
        JsonFileSink sink(dir_, "events");
        sink.write(R"({"second":true})");
    }
    EXPECT_EQ(read_lines(dir_ / "events.ndjson").size(), 2u);
}
