/**
 * @file test_log.cpp
 * @brief Unit tests for log level filtering
 */

#include "hierophant/log.hpp"

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

using namespace hierophant;

/// Redirects a stream buffer for the lifetime of the object
class CaptureStream {
public:
    explicit CaptureStream(std::ostream& stream) : stream_(stream), old_(stream.rdbuf(buffer_.rdbuf())) {}
    ~CaptureStream() { stream_.rdbuf(old_); }

    [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* old_;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = logLevel(); }
    void TearDown() override { setLogLevel(saved_); }

    LogLevel saved_ = LogLevel::Warn;
};

TEST_F(LoggerTest, PrefixesComponent) {
    setLogLevel(LogLevel::Debug);
    CaptureStream out(std::cout);
    CaptureStream err(std::cerr);

    Logger log("PointSampler");
    log.info("ready");
    log.warn("careful");
    log.error("broken");

    EXPECT_EQ(out.text(), "[PointSampler] ready\n");
    EXPECT_EQ(err.text(), "[PointSampler] WARNING: careful\n[PointSampler] ERROR: broken\n");
}

TEST_F(LoggerTest, ThresholdFilters) {
    setLogLevel(LogLevel::Error);
    CaptureStream out(std::cout);
    CaptureStream err(std::cerr);

    Logger log("MapGenerator");
    log.debug("hidden");
    log.info("hidden");
    log.warn("hidden");
    log.error("shown");

    EXPECT_EQ(out.text(), "");
    EXPECT_EQ(err.text(), "[MapGenerator] ERROR: shown\n");
}

TEST_F(LoggerTest, SilentDropsEverything) {
    setLogLevel(LogLevel::Silent);
    CaptureStream err(std::cerr);

    Logger("NameGenerator").error("nothing");
    EXPECT_EQ(err.text(), "");
    EXPECT_EQ(logLevel(), LogLevel::Silent);
}
