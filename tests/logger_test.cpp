#include "common/logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

namespace polykv {

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        spdlog::drop("polykv-test-component");
    }
};

// ── parse_log_level ───────────────────────────────────────────────────────────

TEST_F(LoggerTest, ParsesKnownLevels) {
    EXPECT_EQ(parse_log_level("trace"),    spdlog::level::trace);
    EXPECT_EQ(parse_log_level("debug"),    spdlog::level::debug);
    EXPECT_EQ(parse_log_level("info"),     spdlog::level::info);
    EXPECT_EQ(parse_log_level("warn"),     spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"),    spdlog::level::err);
    EXPECT_EQ(parse_log_level("critical"), spdlog::level::critical);
}

TEST_F(LoggerTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(parse_log_level("loud"), spdlog::level::info);
    EXPECT_FALSE(is_known_log_level("loud"));
    EXPECT_TRUE(is_known_log_level("warn"));
}

// ── Logger registry ───────────────────────────────────────────────────────────

TEST_F(LoggerTest, DefaultLoggerCanBeReinitialized) {
    init_default_logger(spdlog::level::debug);
    init_default_logger(spdlog::level::warn);
    ASSERT_NE(spdlog::default_logger(), nullptr);
    EXPECT_EQ(spdlog::default_logger()->name(), "polykv");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
}

TEST_F(LoggerTest, MakeLoggerIsIdempotent) {
    auto first  = make_logger("polykv-test-component", spdlog::level::debug);
    auto second = make_logger("polykv-test-component", spdlog::level::err);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->level(), spdlog::level::debug);
}

} // namespace polykv
