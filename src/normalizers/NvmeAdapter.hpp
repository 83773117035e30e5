/**
 * @file NvmeAdapter.hpp
 * @brief Normalizer for NVMe SMART / Health Information log telemetry
 */

#pragma once

#include "normalizers/ITelemetryAdapter.hpp"

#include <cstdint>
#include <optional>

/**
 * @class NvmeAdapter
 * @brief Reads nvme_smart_health_information_log and nvme_self_test_log
 *
 * Data units are thousands of 512-byte blocks. The composite temperature
 * is Kelvin in the log page; smartctl usually converts it already.
 */
class NvmeAdapter : public ITelemetryAdapter {
public:
    /// One NVMe data unit: 1000 * 512 bytes
    static constexpr uint64_t DATA_UNIT_BYTES = 512'000;

    [[nodiscard]] auto protocol() const -> Protocol override { return Protocol::NVME; }

    [[nodiscard]] auto recognizes(const nlohmann::json& document) const -> bool override;

    [[nodiscard]] auto normalize(const DeviceIdentity& identity, const RawTelemetry& raw) const
        -> CanonicalAttributes override;

    /**
     * @brief Convert a reported temperature to Celsius
     *
     * Readings of 200 and above can only be Kelvin; lower readings are taken
     * as Celsius.
     */
    [[nodiscard]] static auto to_celsius(int64_t reported) -> std::optional<int64_t>;
};
