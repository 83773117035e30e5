/**
 * @file TelemetryNormalizer.hpp
 * @brief Dispatches raw telemetry to the adapter for its protocol
 */

#pragma once

#include "normalizers/ITelemetryAdapter.hpp"

#include <memory>
#include <vector>

/**
 * @class TelemetryNormalizer
 * @brief Owns the protocol adapters and picks one per device
 *
 * ATA, NVMe and SCSI devices go to their own adapter. USB bridges and
 * unclassified devices go to the first adapter that recognizes the
 * document's health sections. Const after construction, so one instance
 * is shared by all probe workers.
 */
class TelemetryNormalizer {
public:
    /**
     * @brief Normalizer with the ATA, NVMe and SCSI adapters
     */
    TelemetryNormalizer();

    /**
     * @brief Normalizer with a caller-supplied adapter set
     */
    explicit TelemetryNormalizer(std::vector<std::unique_ptr<ITelemetryAdapter>> adapters);

    /**
     * @brief Adapter responsible for @p identity and @p document
     * @return Adapter, or nullptr if none applies
     */
    [[nodiscard]] auto select(const DeviceIdentity& identity,
                              const nlohmann::json& document) const -> const ITelemetryAdapter*;

    /**
     * @brief Canonical record for one device
     *
     * When no adapter applies the result carries the device's protocol and
     * telemetry_available = false.
     */
    [[nodiscard]] auto normalize(const DeviceIdentity& identity, const RawTelemetry& raw) const
        -> CanonicalAttributes;

private:
    std::vector<std::unique_ptr<ITelemetryAdapter>> adapters_;
};
