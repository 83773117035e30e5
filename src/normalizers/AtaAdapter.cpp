/**
 * @file AtaAdapter.cpp
 * @brief Normalizer for ATA/SATA S.M.A.R.T. telemetry
 */

#include "normalizers/AtaAdapter.hpp"

#include "normalizers/AttributeLookup.hpp"
#include "normalizers/JsonFields.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <string>

namespace {

// SMART attribute IDs
constexpr int ATTR_REALLOCATED_SECTORS = 5;
constexpr int ATTR_POWER_ON_HOURS = 9;
constexpr int ATTR_REPORTED_UNCORRECTABLE = 187;
constexpr int ATTR_AIRFLOW_TEMPERATURE = 190;
constexpr int ATTR_TEMPERATURE = 194;
constexpr int ATTR_CURRENT_PENDING_SECTORS = 197;
constexpr int ATTR_OFFLINE_UNCORRECTABLE = 198;
constexpr int ATTR_SSD_LIFE_LEFT = 231;
constexpr int ATTR_AVAILABLE_RESERVED_SPACE = 232;
constexpr int ATTR_TOTAL_LBAS_WRITTEN = 241;
constexpr int ATTR_TOTAL_LBAS_READ = 242;

constexpr uint64_t DEFAULT_LOGICAL_BLOCK_SIZE = 512;
constexpr uint64_t MIB = 1024ULL * 1024;
constexpr uint64_t GIB = MIB * 1024;

/**
 * Drop leading spaces, then parse a signed integer off the front of @p text
 */
auto take_int(std::string_view& text) -> std::optional<int64_t> {
    while (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    text.remove_prefix(static_cast<size_t>(ptr - text.data()));
    return value;
}

/**
 * Temperature attributes pack min/max into the upper raw bytes
 */
auto low_byte_temperature(std::optional<int64_t> raw) -> std::optional<int64_t> {
    if (!raw || *raw < 0) {
        return std::nullopt;
    }
    return *raw > 0xFF ? (*raw & 0xFF) : *raw;
}

auto checked_multiply(uint64_t value, uint64_t factor) -> std::optional<uint64_t> {
    if (factor != 0 && value > std::numeric_limits<uint64_t>::max() / factor) {
        return std::nullopt;
    }
    return value * factor;
}

/**
 * Find a named entry in ata_device_statistics.pages[].table[]
 */
auto device_statistic(const nlohmann::json& document, std::string_view name)
    -> std::optional<int64_t> {
    const auto* pages = json_fields::find(document, {"ata_device_statistics", "pages"});
    if (pages == nullptr || !pages->is_array()) {
        return std::nullopt;
    }
    for (const auto& page : *pages) {
        const auto* table = json_fields::find(page, {"table"});
        if (table == nullptr || !table->is_array()) {
            continue;
        }
        for (const auto& entry : *table) {
            if (json_fields::read_string(entry, {"name"}) == name) {
                return json_fields::read_int(entry, {"value"});
            }
        }
    }
    return std::nullopt;
}

/**
 * Bytes per unit for a host read/write counter row
 *
 * Most drives count LBAs; some name the unit in the attribute itself
 * (Host_Writes_32MiB, Host_Writes_GiB).
 */
auto counter_unit_bytes(const nlohmann::json& row, uint64_t block_size) -> uint64_t {
    auto name = json_fields::read_string(row, {"name"}).value_or("");
    if (name.contains("32MiB")) {
        return 32 * MIB;
    }
    if (name.contains("GiB")) {
        return GIB;
    }
    if (name.contains("MiB")) {
        return MIB;
    }
    return block_size;
}

auto host_bytes(const AttributeLookup& attributes, const nlohmann::json& document, int id,
                std::string_view name, std::string_view statistic_name, uint64_t block_size)
    -> std::optional<uint64_t> {
    if (const auto* row = attributes.find(id, name)) {
        if (auto count = json_fields::read_uint(*row, {"raw", "value"})) {
            return checked_multiply(*count, counter_unit_bytes(*row, block_size));
        }
    }
    if (auto sectors = device_statistic(document, statistic_name); sectors && *sectors >= 0) {
        return checked_multiply(static_cast<uint64_t>(*sectors), block_size);
    }
    return std::nullopt;
}

auto percent_used(const AttributeLookup& attributes, const nlohmann::json& document)
    -> std::optional<int64_t> {
    if (auto life_left = attributes.value(ATTR_SSD_LIFE_LEFT, "SSD_Life_Left",
                                          AttributeField::NORMALIZED)) {
        return std::max<int64_t>(0, 100 - *life_left);
    }
    if (auto used = attributes.value(AttributeLookup::NAME_ONLY, "Percent_Lifetime_Used")) {
        return used;
    }
    return device_statistic(document, "Percentage Used Endurance Indicator");
}

auto self_test_outcomes(const nlohmann::json& document) -> std::vector<SelfTestOutcome> {
    std::vector<SelfTestOutcome> outcomes;

    const nlohmann::json* table =
        json_fields::find(document, {"ata_smart_self_test_log", "extended", "table"});
    if (table == nullptr || !table->is_array()) {
        table = json_fields::find(document, {"ata_smart_self_test_log", "standard", "table"});
    }

    if (table != nullptr && table->is_array()) {
        for (const auto& entry : *table) {
            auto passed = json_fields::read_bool(entry, {"status", "passed"});
            if (!passed) {
                outcomes.push_back(SelfTestOutcome::INCOMPLETE);
            } else {
                outcomes.push_back(*passed ? SelfTestOutcome::PASSED : SelfTestOutcome::FAILED);
            }
        }
    }

    // Drives without a readable log still report the most recent test
    if (outcomes.empty()) {
        if (auto passed = json_fields::read_bool(document,
                                                 {"ata_smart_data", "self_test", "status", "passed"})) {
            outcomes.push_back(*passed ? SelfTestOutcome::PASSED : SelfTestOutcome::FAILED);
        }
    }

    return outcomes;
}

}  // namespace

auto AtaAdapter::recognizes(const nlohmann::json& document) const -> bool {
    const auto* table = json_fields::find(document, {"ata_smart_attributes", "table"});
    return (table != nullptr && table->is_array()) ||
           json_fields::has(document, {"ata_smart_self_test_log"}) ||
           json_fields::has(document, {"ata_device_statistics"});
}

auto AtaAdapter::normalize(const DeviceIdentity& identity, const RawTelemetry& raw) const
    -> CanonicalAttributes {
    const auto& document = raw.document;
    auto attributes = AttributeLookup::from_document(document);

    CanonicalAttributes result;
    result.protocol = identity.protocol;
    result.telemetry_protocol = Protocol::ATA;
    result.telemetry_available = !attributes.empty() ||
                                 json_fields::has(document, {"smart_status"}) ||
                                 json_fields::has(document, {"ata_smart_self_test_log"}) ||
                                 json_fields::has(document, {"ata_device_statistics"});

    result.smart_status = json_fields::read_bool(document, {"smart_status", "passed"});

    result.reallocated_sectors =
        attributes.value(ATTR_REALLOCATED_SECTORS, "Reallocated_Sector_Ct");
    result.pending_sectors =
        attributes.value(ATTR_CURRENT_PENDING_SECTORS, "Current_Pending_Sector");
    result.uncorrectable_errors =
        attributes.value(ATTR_OFFLINE_UNCORRECTABLE, "Offline_Uncorrectable");
    if (!result.uncorrectable_errors) {
        result.uncorrectable_errors =
            attributes.value(ATTR_REPORTED_UNCORRECTABLE, "Reported_Uncorrect");
    }

    result.percent_used = percent_used(attributes, document);
    result.available_spare_pct = attributes.value(
        ATTR_AVAILABLE_RESERVED_SPACE, "Available_Reservd_Space", AttributeField::NORMALIZED);

    result.power_on_hours = json_fields::read_int(document, {"power_on_time", "hours"});
    if (!result.power_on_hours) {
        result.power_on_hours = attributes.value(ATTR_POWER_ON_HOURS, "Power_On_Hours");
    }

    auto block_size = json_fields::read_uint(document, {"logical_block_size"})
                          .value_or(DEFAULT_LOGICAL_BLOCK_SIZE);
    if (block_size == 0) {
        block_size = DEFAULT_LOGICAL_BLOCK_SIZE;
    }
    result.host_writes_bytes = host_bytes(attributes, document, ATTR_TOTAL_LBAS_WRITTEN,
                                          "Total_LBAs_Written", "Logical Sectors Written",
                                          block_size);
    result.host_reads_bytes = host_bytes(attributes, document, ATTR_TOTAL_LBAS_READ,
                                         "Total_LBAs_Read", "Logical Sectors Read", block_size);

    if (auto text = attributes.raw_string(ATTR_TEMPERATURE, "Temperature_Celsius")) {
        auto composite = parse_composite_temperature(*text);
        result.current_temperature = composite.current;
        result.min_temperature = composite.min;
        result.max_temperature = composite.max;
    }
    if (!result.current_temperature) {
        result.current_temperature =
            low_byte_temperature(attributes.value(ATTR_TEMPERATURE, "Temperature_Celsius"));
    }
    if (!result.current_temperature) {
        result.current_temperature = low_byte_temperature(
            attributes.value(ATTR_AIRFLOW_TEMPERATURE, "Airflow_Temperature_Cel"));
    }
    if (!result.current_temperature) {
        result.current_temperature = json_fields::read_int(document, {"temperature", "current"});
    }

    result.self_test_outcomes = self_test_outcomes(document);

    return result;
}

auto AtaAdapter::parse_composite_temperature(std::string_view text) -> CompositeTemperature {
    CompositeTemperature result;

    auto rest = text;
    result.current = take_int(rest);
    if (!result.current) {
        return result;
    }

    constexpr std::string_view MIN_MAX = "Min/Max";
    auto marker = rest.find(MIN_MAX);
    if (marker == std::string_view::npos) {
        return result;
    }
    rest.remove_prefix(marker + MIN_MAX.size());

    auto min = take_int(rest);
    if (!min || rest.empty() || rest.front() != '/') {
        return result;
    }
    rest.remove_prefix(1);
    auto max = take_int(rest);
    if (!max) {
        return result;
    }

    result.min = min;
    result.max = max;
    return result;
}
