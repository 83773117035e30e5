/**
 * @file ITelemetryAdapter.hpp
 * @brief Base interface for per-protocol telemetry normalizers
 */

#pragma once

#include "models/CanonicalAttributes.hpp"
#include "models/DeviceIdentity.hpp"
#include "models/RawTelemetry.hpp"

#include <nlohmann/json.hpp>

/**
 * @class ITelemetryAdapter
 * @brief Maps one protocol's raw telemetry onto CanonicalAttributes
 *
 * normalize() must be a pure function of its arguments: no logging of
 * decisions that change the result, no shared state, no dependence on call
 * order. Adapters are therefore safe to share between probe workers.
 */
class ITelemetryAdapter {
public:
    virtual ~ITelemetryAdapter() = default;

    /**
     * @brief Protocol whose telemetry this adapter understands
     */
    [[nodiscard]] virtual auto protocol() const -> Protocol = 0;

    /**
     * @brief Whether @p document carries this protocol's health sections
     *
     * Used to pick an adapter for USB bridges and unclassified devices.
     */
    [[nodiscard]] virtual auto recognizes(const nlohmann::json& document) const -> bool = 0;

    /**
     * @brief Produce the canonical record for one device
     * @param identity Identity of the device the telemetry belongs to
     * @param raw Telemetry document, never modified
     * @return Canonical record; fields the document lacks stay std::nullopt
     */
    [[nodiscard]] virtual auto normalize(const DeviceIdentity& identity,
                                         const RawTelemetry& raw) const
        -> CanonicalAttributes = 0;
};
