/**
 * @file test_logger.cpp
 * @brief Unit tests for the NDJSON logger front-end.
 */

#include "core/logger.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace codebox;

namespace {

/// Appends every line to a vector owned by the test.
class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override { ++flushes; }

    int flushes = 0;

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

}  // anonymous namespace

class LoggerTest : public ::testing::Test {
protected:
    std::shared_ptr<std::vector<std::string>> lines_ = std::make_shared<std::vector<std::string>>();

    Logger make_logger(LogLevel level = LogLevel::Info) {
        return Logger(std::make_unique<CaptureSink>(lines_), level);
    }
};

TEST_F(LoggerTest, EmitsOneJsonObjectPerLine) {
    auto logger = make_logger();
    logger.info("Execution finished", {{"execution_id", "exec-1"}, {"language", "python"}});

    ASSERT_EQ(lines_->size(), 1u);
    auto line = nlohmann::json::parse(lines_->front());
    EXPECT_EQ(line["level"], "info");
    EXPECT_EQ(line["msg"], "Execution finished");
    EXPECT_EQ(line["execution_id"], "exec-1");
    EXPECT_EQ(line["language"], "python");
    EXPECT_TRUE(line["ts"].get<std::string>().ends_with("Z"));
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    auto logger = make_logger(LogLevel::Warn);
    logger.debug("dropped");
    logger.info("dropped");
    logger.warn("kept");
    logger.error("kept");
    EXPECT_EQ(lines_->size(), 2u);

    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.debug("now kept");
    EXPECT_EQ(lines_->size(), 3u);
}

TEST_F(LoggerTest, EscapesControlCharactersAndQuotes) {
    auto logger = make_logger();
    logger.error("stderr said \"boom\"\n\x01", {{"path", "C:\\tmp"}});

    ASSERT_EQ(lines_->size(), 1u);
    auto line = nlohmann::json::parse(lines_->front());
    EXPECT_EQ(line["msg"], "stderr said \"boom\"\n\x01");
    EXPECT_EQ(line["path"], "C:\\tmp");
}

TEST_F(LoggerTest, ConcurrentWritersProduceWholeLines) {
    auto logger = make_logger();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < 50; ++i) {
                logger.info("tick", {{"thread", std::to_string(t)}});
            }
        });
    }
    for (auto& th : threads) th.join();

    ASSERT_EQ(lines_->size(), 200u);
    for (const auto& l : *lines_) {
        EXPECT_NO_THROW((void)nlohmann::json::parse(l));
    }
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(EscapeJsonTest, PlainTextUnchanged) {
    EXPECT_EQ(escape_json("hello world"), "hello world");
    EXPECT_EQ(escape_json("a\tb"), "a\\tb");
    EXPECT_EQ(escape_json(std::string_view{"\x1f", 1}), "\\u001f");
}
