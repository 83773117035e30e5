/**
 * @file ThresholdPolicy.hpp
 * @brief Immutable grading thresholds
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string_view>

/**
 * @struct ThresholdLimits
 * @brief Constructor argument for ThresholdPolicy
 *
 * Designated initializers let callers override only what they need:
 * @code
 * ThresholdPolicy policy({.available_spare_min = 90});
 * @endcode
 */
struct ThresholdLimits {
    int64_t pending_sectors_max = 10;
    int64_t reallocated_sectors_max = 10;
    int64_t uncorrectable_errors_max = 10;
    int64_t percent_used_max = 100;
    int64_t available_spare_min = 97;      ///< Spare at or below this fails
    double workload_tb_per_year_max = 550.0;
    int64_t warning_temp_minutes_max = 60;
    int64_t critical_temp_minutes_max = 0;

    auto operator==(const ThresholdLimits&) const -> bool = default;
};

/**
 * @class ThresholdPolicy
 * @brief Validated, read-only set of grading thresholds
 *
 * Injected into GradingEngine; the engine holds no numeric limits of its
 * own.
 */
class ThresholdPolicy {
public:
    /**
     * @brief Build a policy from @p limits
     * @throws std::invalid_argument if any limit is negative or not finite
     */
    explicit ThresholdPolicy(ThresholdLimits limits = {}) : limits_(limits) {
        require_non_negative("pending_sectors_max", limits_.pending_sectors_max);
        require_non_negative("reallocated_sectors_max", limits_.reallocated_sectors_max);
        require_non_negative("uncorrectable_errors_max", limits_.uncorrectable_errors_max);
        require_non_negative("percent_used_max", limits_.percent_used_max);
        require_non_negative("available_spare_min", limits_.available_spare_min);
        require_non_negative("warning_temp_minutes_max", limits_.warning_temp_minutes_max);
        require_non_negative("critical_temp_minutes_max", limits_.critical_temp_minutes_max);
        if (!std::isfinite(limits_.workload_tb_per_year_max) ||
            limits_.workload_tb_per_year_max < 0.0) {
            throw std::invalid_argument(
                std::format("workload_tb_per_year_max must be a non-negative number, got {}",
                            limits_.workload_tb_per_year_max));
        }
    }

    [[nodiscard]] auto pending_sectors_max() const -> int64_t {
        return limits_.pending_sectors_max;
    }
    [[nodiscard]] auto reallocated_sectors_max() const -> int64_t {
        return limits_.reallocated_sectors_max;
    }
    [[nodiscard]] auto uncorrectable_errors_max() const -> int64_t {
        return limits_.uncorrectable_errors_max;
    }
    [[nodiscard]] auto percent_used_max() const -> int64_t {
        return limits_.percent_used_max;
    }
    [[nodiscard]] auto available_spare_min() const -> int64_t {
        return limits_.available_spare_min;
    }
    [[nodiscard]] auto workload_tb_per_year_max() const -> double {
        return limits_.workload_tb_per_year_max;
    }
    [[nodiscard]] auto warning_temp_minutes_max() const -> int64_t {
        return limits_.warning_temp_minutes_max;
    }
    [[nodiscard]] auto critical_temp_minutes_max() const -> int64_t {
        return limits_.critical_temp_minutes_max;
    }

    [[nodiscard]] auto limits() const -> const ThresholdLimits& { return limits_; }

    auto operator==(const ThresholdPolicy&) const -> bool = default;

private:
    static void require_non_negative(std::string_view name, int64_t value) {
        if (value < 0) {
            throw std::invalid_argument(
                std::format("{} must not be negative, got {}", name, value));
        }
    }

    ThresholdLimits limits_;
};
