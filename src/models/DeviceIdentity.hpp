/**
 * @file DeviceIdentity.hpp
 * @brief Identity of one physical storage device within a scan
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * @enum Protocol
 * @brief Transport protocol the device was discovered with
 */
enum class Protocol {
    ATA,
    NVME,
    SCSI,
    USB,     ///< USB bridge; telemetry shape depends on the bridge
    UNKNOWN
};

/**
 * @enum MediaType
 * @brief Storage medium, derived from the reported rotation rate
 */
enum class MediaType {
    HDD,
    SSD,
    UNKNOWN
};

[[nodiscard]] constexpr auto protocol_to_string(Protocol protocol) -> std::string_view {
    switch (protocol) {
        case Protocol::ATA:
            return "ATA";
        case Protocol::NVME:
            return "NVMe";
        case Protocol::SCSI:
            return "SCSI";
        case Protocol::USB:
            return "USB";
        case Protocol::UNKNOWN:
            return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Map a smartctl protocol string ("ATA", "NVMe", "SCSI") to Protocol
 *
 * Matching is case-insensitive; anything unrecognized is UNKNOWN.
 */
[[nodiscard]] inline auto protocol_from_string(std::string_view name) -> Protocol {
    auto equals_ignore_case = [name](std::string_view expected) {
        return std::ranges::equal(name, expected, [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    };

    if (equals_ignore_case("ATA") || equals_ignore_case("SATA")) {
        return Protocol::ATA;
    }
    if (equals_ignore_case("NVMe")) {
        return Protocol::NVME;
    }
    if (equals_ignore_case("SCSI") || equals_ignore_case("SAS")) {
        return Protocol::SCSI;
    }
    if (equals_ignore_case("USB")) {
        return Protocol::USB;
    }
    return Protocol::UNKNOWN;
}

[[nodiscard]] constexpr auto media_type_to_string(MediaType type) -> std::string_view {
    switch (type) {
        case MediaType::HDD:
            return "HDD";
        case MediaType::SSD:
            return "SSD";
        case MediaType::UNKNOWN:
            return "Unknown";
    }
    return "Unknown";
}

/**
 * @struct DeviceIdentity
 * @brief Who the device is; (model, serial) is unique within one scan
 */
struct DeviceIdentity {
    std::string path;                         ///< Device path (e.g., /dev/sda)
    Protocol protocol = Protocol::UNKNOWN;    ///< Transport protocol
    std::string device_type;                  ///< smartctl -d type (e.g., "sat", "nvme")
    std::string vendor;                       ///< Vendor, reported or derived from the model
    std::string model;                        ///< Model number, brand prefix stripped
    std::string serial;                       ///< Serial number
    std::string firmware;                     ///< Firmware revision
    std::optional<uint64_t> capacity_bytes;   ///< User capacity, if reported
    MediaType media_type = MediaType::UNKNOWN;

    auto operator==(const DeviceIdentity&) const -> bool = default;
};
