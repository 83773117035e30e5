/**
 * @file ThresholdPolicyTest.cpp
 * @brief Unit tests for ThresholdPolicy
 */

#include "models/ThresholdPolicy.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

class ThresholdPolicyTest : public ::testing::Test {};

TEST_F(ThresholdPolicyTest, DefaultConstruct_HasDocumentedDefaults) {
    ThresholdPolicy policy;

    EXPECT_EQ(policy.pending_sectors_max(), 10);
    EXPECT_EQ(policy.reallocated_sectors_max(), 10);
    EXPECT_EQ(policy.uncorrectable_errors_max(), 10);
    EXPECT_EQ(policy.percent_used_max(), 100);
    EXPECT_EQ(policy.available_spare_min(), 97);
    EXPECT_DOUBLE_EQ(policy.workload_tb_per_year_max(), 550.0);
    EXPECT_EQ(policy.warning_temp_minutes_max(), 60);
    EXPECT_EQ(policy.critical_temp_minutes_max(), 0);
}

TEST_F(ThresholdPolicyTest, Construct_PartialOverride_KeepsOtherDefaults) {
    ThresholdPolicy policy({.available_spare_min = 90, .workload_tb_per_year_max = 1000.0});

    EXPECT_EQ(policy.available_spare_min(), 90);
    EXPECT_DOUBLE_EQ(policy.workload_tb_per_year_max(), 1000.0);
    EXPECT_EQ(policy.pending_sectors_max(), 10);
}

TEST_F(ThresholdPolicyTest, Construct_ZeroLimits_Accepted) {
    EXPECT_NO_THROW(ThresholdPolicy({.pending_sectors_max = 0,
                                     .reallocated_sectors_max = 0,
                                     .uncorrectable_errors_max = 0,
                                     .percent_used_max = 0,
                                     .available_spare_min = 0,
                                     .workload_tb_per_year_max = 0.0,
                                     .warning_temp_minutes_max = 0,
                                     .critical_temp_minutes_max = 0}));
}

TEST_F(ThresholdPolicyTest, Construct_NegativeLimit_Throws) {
    EXPECT_THROW(ThresholdPolicy({.pending_sectors_max = -1}), std::invalid_argument);
    EXPECT_THROW(ThresholdPolicy({.available_spare_min = -5}), std::invalid_argument);
    EXPECT_THROW(ThresholdPolicy({.critical_temp_minutes_max = -1}), std::invalid_argument);
}

TEST_F(ThresholdPolicyTest, Construct_NegativeWorkload_Throws) {
    EXPECT_THROW(ThresholdPolicy({.workload_tb_per_year_max = -0.5}), std::invalid_argument);
}

TEST_F(ThresholdPolicyTest, Construct_NonFiniteWorkload_Throws) {
    EXPECT_THROW(ThresholdPolicy({.workload_tb_per_year_max = std::numeric_limits<double>::nan()}),
                 std::invalid_argument);
    EXPECT_THROW(
        ThresholdPolicy({.workload_tb_per_year_max = std::numeric_limits<double>::infinity()}),
        std::invalid_argument);
}

TEST_F(ThresholdPolicyTest, Equality_SameLimits_Equal) {
    EXPECT_EQ(ThresholdPolicy({.percent_used_max = 80}), ThresholdPolicy({.percent_used_max = 80}));
    EXPECT_NE(ThresholdPolicy({.percent_used_max = 80}), ThresholdPolicy());
}
