/**
 * @file JsonSerialization.cpp
 * @brief nlohmann::json conversions for the scan output triple
 */

#include "models/JsonSerialization.hpp"

#include <string>

namespace {

template<typename T>
auto optional_to_json(const std::optional<T>& value) -> nlohmann::json {
    if (!value) {
        return nullptr;
    }
    return *value;
}

}  // namespace

void to_json(nlohmann::json& j, const DeviceIdentity& identity) {
    j = nlohmann::json{
        {"path", identity.path},
        {"protocol", std::string(protocol_to_string(identity.protocol))},
        {"device_type", identity.device_type},
        {"vendor", identity.vendor},
        {"model", identity.model},
        {"serial", identity.serial},
        {"firmware", identity.firmware},
        {"capacity_bytes", optional_to_json(identity.capacity_bytes)},
        {"media_type", std::string(media_type_to_string(identity.media_type))},
    };
}

void to_json(nlohmann::json& j, const CanonicalAttributes& attributes) {
    auto self_tests = nlohmann::json::array();
    for (auto outcome : attributes.self_test_outcomes) {
        self_tests.push_back(std::string(self_test_outcome_to_string(outcome)));
    }

    j = nlohmann::json{
        {"protocol", std::string(protocol_to_string(attributes.protocol))},
        {"telemetry_protocol", std::string(protocol_to_string(attributes.telemetry_protocol))},
        {"telemetry_available", attributes.telemetry_available},
        {"smart_status", optional_to_json(attributes.smart_status)},
        {"pending_sectors", optional_to_json(attributes.pending_sectors)},
        {"reallocated_sectors", optional_to_json(attributes.reallocated_sectors)},
        {"uncorrectable_errors", optional_to_json(attributes.uncorrectable_errors)},
        {"percent_used", optional_to_json(attributes.percent_used)},
        {"available_spare_pct", optional_to_json(attributes.available_spare_pct)},
        {"power_on_hours", optional_to_json(attributes.power_on_hours)},
        {"host_reads_bytes", optional_to_json(attributes.host_reads_bytes)},
        {"host_writes_bytes", optional_to_json(attributes.host_writes_bytes)},
        {"current_temperature", optional_to_json(attributes.current_temperature)},
        {"min_temperature", optional_to_json(attributes.min_temperature)},
        {"max_temperature", optional_to_json(attributes.max_temperature)},
        {"warning_temp_time", optional_to_json(attributes.warning_temp_time)},
        {"critical_temp_time", optional_to_json(attributes.critical_temp_time)},
        {"self_test_outcomes", std::move(self_tests)},
    };
}

void to_json(nlohmann::json& j, const GradeResult& grade) {
    j = nlohmann::json{
        {"status", std::string(grade_status_to_string(grade.status))},
        {"failure_reason", nullptr},
        {"flag_reason", nullptr},
        {"workload_tb_per_year", optional_to_json(grade.workload_tb_per_year)},
    };
    if (grade.failure_reason) {
        j["failure_reason"] = std::string(failure_reason_to_string(*grade.failure_reason));
    }
    if (grade.flag_reason) {
        j["flag_reason"] = std::string(flag_reason_to_string(*grade.flag_reason));
    }
}

void to_json(nlohmann::json& j, const GradedDevice& device) {
    j = nlohmann::json{
        {"identity", device.identity},
        {"attributes", device.attributes},
        {"grade", device.grade},
    };
    if (!device.detail.empty()) {
        j["detail"] = device.detail;
    }
}

auto graded_devices_to_json(const std::vector<GradedDevice>& devices) -> nlohmann::json {
    auto array = nlohmann::json::array();
    for (const auto& device : devices) {
        array.push_back(device);
    }
    return array;
}
