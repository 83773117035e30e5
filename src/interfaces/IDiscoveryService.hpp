/**
 * @file IDiscoveryService.hpp
 * @brief Interface for enumerating and probing storage devices
 */

#pragma once

#include "models/DiscoveryTypes.hpp"
#include "models/RawTelemetry.hpp"
#include "util/Error.hpp"

#include <atomic>
#include <expected>

/**
 * @class IDiscoveryService
 * @brief Finds devices and fetches their raw telemetry
 */
class IDiscoveryService {
public:
    virtual ~IDiscoveryService() = default;

    /**
     * @brief List reachable devices, classified and filtered
     * @return Candidates plus per-device failures, or an error if the scan
     *         itself could not run
     *
     * Ignore filters are applied here, before any telemetry probe. Once
     * @p cancel_flag is set no further detection probe starts; devices still
     * waiting for one are reported as CANCELLED failures.
     */
    [[nodiscard]] virtual auto enumerate(const std::atomic<bool>& cancel_flag)
        -> std::expected<DiscoveryResult, util::Error> = 0;

    /**
     * @brief Fetch the full telemetry document for one candidate
     * @return Parsed document, or an error if the device could not be read
     */
    [[nodiscard]] virtual auto probe(const DeviceCandidate& candidate)
        -> std::expected<RawTelemetry, util::Error> = 0;
};
