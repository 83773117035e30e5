/**
 * @file ScsiAdapter.hpp
 * @brief Normalizer for SCSI/SAS log page telemetry
 */

#pragma once

#include "normalizers/ITelemetryAdapter.hpp"

/**
 * @class ScsiAdapter
 * @brief Reads the error counter log, defect lists and self-test results
 *
 * The grown defect list stands in for reallocated sectors; uncorrected
 * errors are summed across the read, write and verify counters.
 */
class ScsiAdapter : public ITelemetryAdapter {
public:
    [[nodiscard]] auto protocol() const -> Protocol override { return Protocol::SCSI; }

    [[nodiscard]] auto recognizes(const nlohmann::json& document) const -> bool override;

    [[nodiscard]] auto normalize(const DeviceIdentity& identity, const RawTelemetry& raw) const
        -> CanonicalAttributes override;
};
