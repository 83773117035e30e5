/**
 * @file AtaAdapter.hpp
 * @brief Normalizer for ATA/SATA S.M.A.R.T. telemetry
 */

#pragma once

#include "normalizers/ITelemetryAdapter.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

/**
 * @struct CompositeTemperature
 * @brief Pieces of a temperature raw string such as "30 (Min/Max 25/40)"
 */
struct CompositeTemperature {
    std::optional<int64_t> current;
    std::optional<int64_t> min;
    std::optional<int64_t> max;
};

/**
 * @class AtaAdapter
 * @brief Reads the SMART attribute table, device statistics and self-test log
 *
 * Attribute IDs used: 5, 9, 187, 190, 194, 197, 198, 231, 232, 241, 242.
 * Byte counters reported in LBAs are scaled by logical_block_size.
 */
class AtaAdapter : public ITelemetryAdapter {
public:
    [[nodiscard]] auto protocol() const -> Protocol override { return Protocol::ATA; }

    [[nodiscard]] auto recognizes(const nlohmann::json& document) const -> bool override;

    [[nodiscard]] auto normalize(const DeviceIdentity& identity, const RawTelemetry& raw) const
        -> CanonicalAttributes override;

    /**
     * @brief Parse a composite temperature string
     *
     * Leading integer is the current reading; "Min/Max a/b" adds bounds.
     * Anything unparseable leaves the corresponding field empty.
     */
    [[nodiscard]] static auto parse_composite_temperature(std::string_view text)
        -> CompositeTemperature;
};
