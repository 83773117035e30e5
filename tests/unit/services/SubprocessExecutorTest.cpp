/**
 * @file SubprocessExecutorTest.cpp
 * @brief Unit tests for SubprocessExecutor
 *
 * These run /bin/sh as a stand-in for smartctl.
 */

#include "services/SubprocessExecutor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>

using namespace std::chrono_literals;

class SubprocessExecutorTest : public ::testing::Test {
protected:
    SubprocessExecutor executor;

    static Command Shell(const std::string& script, std::chrono::milliseconds timeout = 5000ms) {
        return Command{.argv = {"/bin/sh", "-c", script}, .timeout = timeout};
    }
};

TEST_F(SubprocessExecutorTest, Execute_Echo_CapturesStdout) {
    auto result = executor.execute(Shell("echo '{\"devices\": []}'"));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 0);
    EXPECT_EQ(result->stdout_data, "{\"devices\": []}\n");
}

TEST_F(SubprocessExecutorTest, Execute_NonZeroExit_ReturnedNotError) {
    auto result = executor.execute(Shell("echo out; echo err >&2; exit 4"));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 4);
    EXPECT_EQ(result->stdout_data, "out\n");
    EXPECT_EQ(result->stderr_data, "err\n");
}

TEST_F(SubprocessExecutorTest, Execute_LargeOutput_FullyDrained) {
    auto result = executor.execute(Shell("i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done"));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdout_data.size(), 20000u * 11u);
}

TEST_F(SubprocessExecutorTest, Execute_ExceedsTimeout_ReturnsTimedOut) {
    auto start = std::chrono::steady_clock::now();
    auto result = executor.execute(Shell("sleep 5", 200ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(util::ErrorCode::TIMED_OUT));
    EXPECT_LT(elapsed, 3s);
}

TEST_F(SubprocessExecutorTest, Execute_MissingBinary_ReturnsSpawnFailed) {
    auto result = executor.execute(Command{.argv = {"/nonexistent/smartctl", "--scan-open"}});

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(util::ErrorCode::SPAWN_FAILED));
    EXPECT_THAT(result.error().message, testing::HasSubstr("/nonexistent/smartctl"));
}

TEST_F(SubprocessExecutorTest, Execute_EmptyArgv_ReturnsInvalidArgument) {
    auto result = executor.execute(Command{});

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(util::ErrorCode::INVALID_ARGUMENT));
}

TEST_F(SubprocessExecutorTest, Execute_RecordsDuration) {
    auto result = executor.execute(Shell("sleep 0.1"));

    ASSERT_TRUE(result.has_value());
    EXPECT_GE(result->duration, 90ms);
}
