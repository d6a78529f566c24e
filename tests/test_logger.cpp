#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "f1ar/logger.hpp"

namespace f1ar {

TEST(LoggerTest, RoutesProblemsToStderr) {
    // Info goes to stdout; warnings and errors go to stderr.
    Logger::set_min_level(LogLevel::Info);

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    Logger::log(LogLevel::Info, "loading session");
    Logger::log(LogLevel::Warn, "skipping driver 2");
    Logger::log(LogLevel::Error, "no usable data");
    const std::string out = testing::internal::GetCapturedStdout();
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(out, "[INFO] loading session\n");
    EXPECT_EQ(err, "[WARN] skipping driver 2\n[ERROR] no usable data\n");
}

TEST(LoggerTest, DropsMessagesBelowMinimumLevel) {
    // Debug is suppressed at the default level and shown once enabled.
    Logger::set_min_level(LogLevel::Info);
    testing::internal::CaptureStdout();
    Logger::log(LogLevel::Debug, "merge details");
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");

    Logger::set_min_level(LogLevel::Debug);
    testing::internal::CaptureStdout();
    Logger::log(LogLevel::Debug, "merge details");
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "[DEBUG] merge details\n");

    Logger::set_min_level(LogLevel::Info);
}

TEST(LoggerTest, ParsesLevelNames) {
    // Level names are case-insensitive; unknown names throw.
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_THROW(parse_log_level("verbose"), std::runtime_error);
}

} // namespace f1ar
