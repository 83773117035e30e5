/**
 * @file DiscoveryTypes.hpp
 * @brief Types exchanged between device discovery and the scan service
 */

#pragma once

#include "models/DeviceIdentity.hpp"
#include "util/Error.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @struct DiscoveryOptions
 * @brief Filters and command settings for one enumeration
 */
struct DiscoveryOptions {
    bool ignore_ata = false;
    bool ignore_nvme = false;
    bool ignore_scsi = false;
    bool ignore_usb = false;
    std::vector<std::string> explicit_devices;  ///< When non-empty, replaces the scan command
    std::string smartctl_path = "smartctl";
    std::chrono::milliseconds command_timeout{30'000};
};

/**
 * @struct DeviceCandidate
 * @brief A reachable, classified device waiting for its telemetry probe
 */
struct DeviceCandidate {
    size_t order = 0;                       ///< Position in discovery order
    std::string path;
    std::string device_type;                ///< smartctl -d argument, may be empty
    Protocol protocol = Protocol::UNKNOWN;

    auto operator==(const DeviceCandidate&) const -> bool = default;
};

/**
 * @struct DiscoveryFailure
 * @brief A device found by the scan that could not be opened or classified
 */
struct DiscoveryFailure {
    size_t order = 0;
    std::string path;
    std::string device_type;
    Protocol protocol = Protocol::UNKNOWN;
    util::Error error;
};

/**
 * @struct DiscoveryResult
 * @brief Candidates and failures; together they cover every device found
 */
struct DiscoveryResult {
    std::vector<DeviceCandidate> devices;
    std::vector<DiscoveryFailure> failures;

    [[nodiscard]] auto total() const -> size_t { return devices.size() + failures.size(); }
};
