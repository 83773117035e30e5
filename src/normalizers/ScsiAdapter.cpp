/**
 * @file ScsiAdapter.cpp
 * @brief Normalizer for SCSI/SAS log page telemetry
 */

#include "normalizers/ScsiAdapter.hpp"

#include "normalizers/JsonFields.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <ranges>
#include <string>
#include <utility>

namespace {

constexpr std::string_view SELF_TEST_PREFIX = "scsi_self_test_";
constexpr double BYTES_PER_GB = 1e9;

// Self-test results (SPC-4 self-test results log page): 0 completed,
// 1-2 aborted, 3-7 failed, 15 in progress
constexpr int64_t RESULT_COMPLETED = 0;
constexpr int64_t RESULT_FIRST_FAILURE = 3;
constexpr int64_t RESULT_LAST_FAILURE = 7;

auto has_scsi_health_data(const nlohmann::json& document) -> bool {
    if (json_fields::has(document, {"scsi_error_counter_log"}) ||
        json_fields::has(document, {"scsi_grown_defect_list"}) ||
        json_fields::has(document, {"scsi_pending_defects"}) ||
        json_fields::has(document, {"scsi_percentage_used_endurance_indicator"})) {
        return true;
    }
    if (!document.is_object()) {
        return false;
    }
    for (const auto& item : document.items()) {
        if (std::string_view(item.key()).starts_with(SELF_TEST_PREFIX)) {
            return true;
        }
    }
    return false;
}

auto uncorrected_errors(const nlohmann::json& document) -> std::optional<int64_t> {
    std::optional<int64_t> total;
    for (auto section : {"read", "write", "verify"}) {
        auto count = json_fields::read_int(
            document, {"scsi_error_counter_log", section, "total_uncorrected_errors"});
        if (count) {
            total = total.value_or(0) + *count;
        }
    }
    return total;
}

auto gigabytes_to_bytes(std::optional<double> gigabytes) -> std::optional<uint64_t> {
    if (!gigabytes || *gigabytes < 0.0) {
        return std::nullopt;
    }
    auto bytes = std::round(*gigabytes * BYTES_PER_GB);
    if (bytes >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(bytes);
}

/**
 * scsi_self_test_<n> entries, ordered by n
 */
auto self_test_outcomes(const nlohmann::json& document) -> std::vector<SelfTestOutcome> {
    std::vector<std::pair<int, const nlohmann::json*>> entries;

    if (!document.is_object()) {
        return {};
    }
    for (const auto& item : document.items()) {
        std::string_view key(item.key());
        if (!key.starts_with(SELF_TEST_PREFIX)) {
            continue;
        }
        auto suffix = key.substr(SELF_TEST_PREFIX.size());
        int index = 0;
        auto [ptr, ec] = std::from_chars(suffix.data(), suffix.data() + suffix.size(), index);
        if (ec != std::errc{} || ptr != suffix.data() + suffix.size()) {
            continue;
        }
        entries.emplace_back(index, &item.value());
    }

    std::ranges::sort(entries, {}, &std::pair<int, const nlohmann::json*>::first);

    std::vector<SelfTestOutcome> outcomes;
    outcomes.reserve(entries.size());
    for (const auto& entry : entries | std::views::values) {
        auto result = json_fields::read_int(*entry, {"result", "value"});
        if (result && *result == RESULT_COMPLETED) {
            outcomes.push_back(SelfTestOutcome::PASSED);
        } else if (result && *result >= RESULT_FIRST_FAILURE && *result <= RESULT_LAST_FAILURE) {
            outcomes.push_back(SelfTestOutcome::FAILED);
        } else {
            outcomes.push_back(SelfTestOutcome::INCOMPLETE);
        }
    }
    return outcomes;
}

}  // namespace

auto ScsiAdapter::recognizes(const nlohmann::json& document) const -> bool {
    return has_scsi_health_data(document);
}

auto ScsiAdapter::normalize(const DeviceIdentity& identity, const RawTelemetry& raw) const
    -> CanonicalAttributes {
    const auto& document = raw.document;

    CanonicalAttributes result;
    result.protocol = identity.protocol;
    result.telemetry_protocol = Protocol::SCSI;
    result.telemetry_available =
        has_scsi_health_data(document) || json_fields::has(document, {"smart_status"});

    result.smart_status = json_fields::read_bool(document, {"smart_status", "passed"});

    result.reallocated_sectors = json_fields::read_int(document, {"scsi_grown_defect_list"});
    result.pending_sectors = json_fields::read_int(document, {"scsi_pending_defects", "count"});
    result.uncorrectable_errors = uncorrected_errors(document);
    result.percent_used =
        json_fields::read_int(document, {"scsi_percentage_used_endurance_indicator"});

    result.power_on_hours = json_fields::read_int(document, {"power_on_time", "hours"});

    result.host_reads_bytes = gigabytes_to_bytes(json_fields::read_double(
        document, {"scsi_error_counter_log", "read", "gigabytes_processed"}));
    result.host_writes_bytes = gigabytes_to_bytes(json_fields::read_double(
        document, {"scsi_error_counter_log", "write", "gigabytes_processed"}));

    result.current_temperature = json_fields::read_int(document, {"temperature", "current"});

    result.self_test_outcomes = self_test_outcomes(document);

    return result;
}
