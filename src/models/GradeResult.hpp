/**
 * @file GradeResult.hpp
 * @brief Verdict types produced by the grading engine
 */

#pragma once

#include "models/CanonicalAttributes.hpp"
#include "models/DeviceIdentity.hpp"

#include <optional>
#include <string>
#include <string_view>

/**
 * @enum GradeStatus
 * @brief Overall verdict
 *
 * A flagged device is a PASS carrying a FlagReason.
 */
enum class GradeStatus {
    PASS,
    FAIL,
    ERROR  ///< Telemetry could not be obtained or evaluated
};

/**
 * @enum FailureReason
 * @brief Why a device did not pass; exactly one per FAIL/ERROR result
 */
enum class FailureReason {
    DATA_READ_ERROR,
    FAILED_SELF_TEST,
    PENDING_SECTORS,
    REALLOCATED_SECTORS,
    PERCENT_USED,
    AVAILABLE_SPARE,
    MEDIA_ERRORS,
    CRITICAL_TEMP
};

/**
 * @enum FlagReason
 * @brief Non-fatal caveat attached to a passing device
 */
enum class FlagReason {
    HEAVY_USE,
    TEMP_WARNING
};

[[nodiscard]] constexpr auto grade_status_to_string(GradeStatus status) -> std::string_view {
    switch (status) {
        case GradeStatus::PASS:
            return "Pass";
        case GradeStatus::FAIL:
            return "Fail";
        case GradeStatus::ERROR:
            return "Error";
    }
    return "Error";
}

[[nodiscard]] constexpr auto failure_reason_to_string(FailureReason reason) -> std::string_view {
    switch (reason) {
        case FailureReason::DATA_READ_ERROR:
            return "DataReadError";
        case FailureReason::FAILED_SELF_TEST:
            return "FailedSelfTest";
        case FailureReason::PENDING_SECTORS:
            return "PendingSectors";
        case FailureReason::REALLOCATED_SECTORS:
            return "ReallocatedSectors";
        case FailureReason::PERCENT_USED:
            return "PercentUsed";
        case FailureReason::AVAILABLE_SPARE:
            return "AvailableSpare";
        case FailureReason::MEDIA_ERRORS:
            return "MediaErrors";
        case FailureReason::CRITICAL_TEMP:
            return "CriticalTemp";
    }
    return "DataReadError";
}

[[nodiscard]] constexpr auto flag_reason_to_string(FlagReason reason) -> std::string_view {
    switch (reason) {
        case FlagReason::HEAVY_USE:
            return "HeavyUse";
        case FlagReason::TEMP_WARNING:
            return "TempWarning";
    }
    return "HeavyUse";
}

/**
 * @struct GradeResult
 * @brief Outcome of grading one canonical record
 */
struct GradeResult {
    GradeStatus status = GradeStatus::ERROR;
    std::optional<FailureReason> failure_reason;
    std::optional<FlagReason> flag_reason;
    std::optional<double> workload_tb_per_year;  ///< Set whenever it could be derived

    [[nodiscard]] auto is_pass() const -> bool { return status == GradeStatus::PASS; }
    [[nodiscard]] auto is_flagged() const -> bool { return is_pass() && flag_reason.has_value(); }

    [[nodiscard]] static auto pass() -> GradeResult {
        return GradeResult{.status = GradeStatus::PASS};
    }

    [[nodiscard]] static auto flagged(FlagReason reason) -> GradeResult {
        return GradeResult{.status = GradeStatus::PASS, .flag_reason = reason};
    }

    [[nodiscard]] static auto fail(FailureReason reason) -> GradeResult {
        return GradeResult{.status = GradeStatus::FAIL, .failure_reason = reason};
    }

    [[nodiscard]] static auto read_error() -> GradeResult {
        return GradeResult{.status = GradeStatus::ERROR,
                           .failure_reason = FailureReason::DATA_READ_ERROR};
    }

    auto operator==(const GradeResult&) const -> bool = default;
};

/**
 * @struct GradedDevice
 * @brief The per-device output triple of a scan
 */
struct GradedDevice {
    DeviceIdentity identity;
    CanonicalAttributes attributes;
    GradeResult grade;
    std::string detail;  ///< Why an ERROR result happened; empty otherwise

    auto operator==(const GradedDevice&) const -> bool = default;
};
