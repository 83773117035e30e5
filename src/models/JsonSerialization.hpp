/**
 * @file JsonSerialization.hpp
 * @brief nlohmann::json conversions for the scan output triple
 *
 * Not-reported fields serialize as null so consumers can tell them apart
 * from zero.
 */

#pragma once

#include "models/CanonicalAttributes.hpp"
#include "models/DeviceIdentity.hpp"
#include "models/GradeResult.hpp"

#include <nlohmann/json.hpp>

#include <vector>

void to_json(nlohmann::json& j, const DeviceIdentity& identity);
void to_json(nlohmann::json& j, const CanonicalAttributes& attributes);
void to_json(nlohmann::json& j, const GradeResult& grade);
void to_json(nlohmann::json& j, const GradedDevice& device);

/**
 * @brief Serialize a whole scan as a JSON array in scan order
 */
[[nodiscard]] auto graded_devices_to_json(const std::vector<GradedDevice>& devices)
    -> nlohmann::json;
