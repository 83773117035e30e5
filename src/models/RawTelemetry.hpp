/**
 * @file RawTelemetry.hpp
 * @brief Unparsed per-device telemetry as returned by smartctl
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>

/**
 * @struct RawTelemetry
 * @brief One smartctl JSON document for one device
 *
 * Created once per probe and only ever read afterwards; adapters take it by
 * const reference.
 */
struct RawTelemetry {
    nlohmann::json document;                   ///< Root object of `smartctl --xall --json`
    int exit_status = 0;                       ///< smartctl exit bitmask
    std::chrono::milliseconds probe_duration{0};
};
