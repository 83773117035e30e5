/**
 * @file IdentityParser.hpp
 * @brief Builds DeviceIdentity from a telemetry document
 */

#pragma once

#include "models/DeviceIdentity.hpp"
#include "models/DiscoveryTypes.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

/**
 * @class IdentityParser
 * @brief Reads model/serial/firmware and works out the vendor
 *
 * ATA and NVMe drives rarely report a vendor field. The vendor then comes
 * from a brand word in the model family, then from the model number (brand
 * word, then well-known prefixes), and finally from the family text as is.
 */
class IdentityParser {
public:
    /**
     * @brief Identity for @p candidate using what @p document reports
     */
    [[nodiscard]] static auto parse(const DeviceCandidate& candidate,
                                    const nlohmann::json& document) -> DeviceIdentity;

    /**
     * @brief Identity carrying only what discovery knows (path, protocol, type)
     */
    [[nodiscard]] static auto from_candidate(const DeviceCandidate& candidate) -> DeviceIdentity;

    /**
     * @brief Vendor display name for a brand word (e.g. "WDC" -> "Western Digital")
     */
    [[nodiscard]] static auto canonical_brand(std::string_view word)
        -> std::optional<std::string>;

    /**
     * @brief Vendor derived from a model number, if recognizable
     */
    [[nodiscard]] static auto vendor_from_model(std::string_view model)
        -> std::optional<std::string>;

    /**
     * @brief Model number with a leading brand word removed
     *
     * "Samsung SSD 860 EVO" -> "SSD 860 EVO". Models without a leading
     * brand word are returned unchanged.
     */
    [[nodiscard]] static auto strip_brand(std::string_view model) -> std::string;
};
