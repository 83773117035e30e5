/**
 * @file NvmeAdapter.cpp
 * @brief Normalizer for NVMe SMART / Health Information log telemetry
 */

#include "normalizers/NvmeAdapter.hpp"

#include "normalizers/JsonFields.hpp"

#include <limits>

namespace {

constexpr std::string_view HEALTH_LOG = "nvme_smart_health_information_log";

constexpr int64_t KELVIN_THRESHOLD = 200;
constexpr int64_t KELVIN_OFFSET = 273;

// Self-test result codes (NVMe base spec, Get Log Page 06h)
constexpr int64_t RESULT_NO_ERROR = 0;
constexpr int64_t RESULT_FATAL_ERROR = 5;
constexpr int64_t RESULT_FAILED_SEGMENT = 7;

auto health_field(const nlohmann::json& document, std::string_view field)
    -> const nlohmann::json* {
    return json_fields::find(document, {HEALTH_LOG, field});
}

auto data_units_to_bytes(std::optional<uint64_t> units) -> std::optional<uint64_t> {
    if (!units) {
        return std::nullopt;
    }
    if (*units > std::numeric_limits<uint64_t>::max() / NvmeAdapter::DATA_UNIT_BYTES) {
        return std::nullopt;
    }
    return *units * NvmeAdapter::DATA_UNIT_BYTES;
}

auto self_test_outcomes(const nlohmann::json& document) -> std::vector<SelfTestOutcome> {
    std::vector<SelfTestOutcome> outcomes;

    const auto* table = json_fields::find(document, {"nvme_self_test_log", "table"});
    if (table == nullptr || !table->is_array()) {
        return outcomes;
    }

    for (const auto& entry : *table) {
        auto result = json_fields::read_int(entry, {"self_test_result", "value"});
        if (!result) {
            outcomes.push_back(SelfTestOutcome::INCOMPLETE);
        } else if (*result == RESULT_NO_ERROR) {
            outcomes.push_back(SelfTestOutcome::PASSED);
        } else if (*result >= RESULT_FATAL_ERROR && *result <= RESULT_FAILED_SEGMENT) {
            outcomes.push_back(SelfTestOutcome::FAILED);
        } else {
            // 1-4: aborted by command, reset, namespace removal or format
            outcomes.push_back(SelfTestOutcome::INCOMPLETE);
        }
    }

    return outcomes;
}

}  // namespace

auto NvmeAdapter::to_celsius(int64_t reported) -> std::optional<int64_t> {
    if (reported >= KELVIN_THRESHOLD) {
        return reported - KELVIN_OFFSET;
    }
    return reported;
}

auto NvmeAdapter::recognizes(const nlohmann::json& document) const -> bool {
    return json_fields::has(document, {HEALTH_LOG});
}

auto NvmeAdapter::normalize(const DeviceIdentity& identity, const RawTelemetry& raw) const
    -> CanonicalAttributes {
    const auto& document = raw.document;

    CanonicalAttributes result;
    result.protocol = identity.protocol;
    result.telemetry_protocol = Protocol::NVME;
    result.telemetry_available = json_fields::has(document, {HEALTH_LOG}) ||
                                 json_fields::has(document, {"smart_status"}) ||
                                 json_fields::has(document, {"nvme_self_test_log"});

    result.smart_status = json_fields::read_bool(document, {"smart_status", "passed"});

    result.percent_used = json_fields::as_int(health_field(document, "percentage_used"));
    result.available_spare_pct = json_fields::as_int(health_field(document, "available_spare"));
    result.uncorrectable_errors = json_fields::as_int(health_field(document, "media_errors"));
    result.warning_temp_time = json_fields::as_int(health_field(document, "warning_temp_time"));
    result.critical_temp_time =
        json_fields::as_int(health_field(document, "critical_comp_time"));

    result.power_on_hours = json_fields::as_int(health_field(document, "power_on_hours"));
    if (!result.power_on_hours) {
        result.power_on_hours = json_fields::read_int(document, {"power_on_time", "hours"});
    }

    result.host_reads_bytes =
        data_units_to_bytes(json_fields::as_uint(health_field(document, "data_units_read")));
    result.host_writes_bytes =
        data_units_to_bytes(json_fields::as_uint(health_field(document, "data_units_written")));

    if (auto reported = json_fields::as_int(health_field(document, "temperature"))) {
        result.current_temperature = to_celsius(*reported);
    } else if (auto current = json_fields::read_int(document, {"temperature", "current"})) {
        result.current_temperature = to_celsius(*current);
    }

    result.self_test_outcomes = self_test_outcomes(document);

    return result;
}
