/**
 * @file CanonicalAttributes.hpp
 * @brief Protocol-agnostic health record produced by the normalizers
 */

#pragma once

#include "models/DeviceIdentity.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

/**
 * @enum SelfTestOutcome
 * @brief Result marker for one entry of a device self-test log
 */
enum class SelfTestOutcome {
    PASSED,
    FAILED,
    INCOMPLETE  ///< Aborted, interrupted or still running
};

[[nodiscard]] constexpr auto self_test_outcome_to_string(SelfTestOutcome outcome)
    -> std::string_view {
    switch (outcome) {
        case SelfTestOutcome::PASSED:
            return "passed";
        case SelfTestOutcome::FAILED:
            return "failed";
        case SelfTestOutcome::INCOMPLETE:
            return "incomplete";
    }
    return "incomplete";
}

/**
 * @struct CanonicalAttributes
 * @brief Health attributes in one shape regardless of protocol
 *
 * Every numeric field is optional: std::nullopt means the device did not
 * report it (or reported something unparseable), which is never the same
 * as zero. Graders skip checks whose input is std::nullopt.
 */
struct CanonicalAttributes {
    Protocol protocol = Protocol::UNKNOWN;
    Protocol telemetry_protocol = Protocol::UNKNOWN;  ///< Layout of the health data; picks the rule set
    bool telemetry_available = false;  ///< At least one health section was present

    std::optional<bool> smart_status;  ///< Overall SMART verdict (informational)

    std::optional<int64_t> pending_sectors;
    std::optional<int64_t> reallocated_sectors;     ///< SCSI: grown defect list length
    std::optional<int64_t> uncorrectable_errors;    ///< NVMe: media_errors

    std::optional<int64_t> percent_used;            ///< Endurance consumed, may exceed 100
    std::optional<int64_t> available_spare_pct;

    std::optional<int64_t> power_on_hours;
    std::optional<uint64_t> host_reads_bytes;
    std::optional<uint64_t> host_writes_bytes;

    std::optional<int64_t> current_temperature;     ///< Celsius
    std::optional<int64_t> min_temperature;         ///< Celsius, from composite readings
    std::optional<int64_t> max_temperature;         ///< Celsius, from composite readings
    std::optional<int64_t> warning_temp_time;       ///< Minutes above warning threshold
    std::optional<int64_t> critical_temp_time;      ///< Minutes above critical threshold

    std::vector<SelfTestOutcome> self_test_outcomes;  ///< Log order, newest first

    auto operator==(const CanonicalAttributes&) const -> bool = default;
};
