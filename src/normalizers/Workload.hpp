/**
 * @file Workload.hpp
 * @brief Annualized host I/O volume
 */

#pragma once

#include "models/CanonicalAttributes.hpp"

#include <optional>

namespace workload {

/// 1 TiB, the unit workload ratings are compared in
inline constexpr double BYTES_PER_TB = 1024.0 * 1024.0 * 1024.0 * 1024.0;

/// 365.25 days
inline constexpr double HOURS_PER_YEAR = 8766.0;

/**
 * @brief (reads + writes) / 1 TiB / (power_on_hours / 8766)
 * @return TB per year, or nullopt (undetermined) when power-on hours are
 *         missing or not positive, or either byte counter is missing
 */
[[nodiscard]] auto tb_per_year(const CanonicalAttributes& attributes) -> std::optional<double>;

}  // namespace workload
