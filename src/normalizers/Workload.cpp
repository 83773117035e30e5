/**
 * @file Workload.cpp
 * @brief Annualized host I/O volume
 */

#include "normalizers/Workload.hpp"

namespace workload {

auto tb_per_year(const CanonicalAttributes& attributes) -> std::optional<double> {
    if (!attributes.power_on_hours || *attributes.power_on_hours <= 0) {
        return std::nullopt;
    }
    if (!attributes.host_reads_bytes || !attributes.host_writes_bytes) {
        return std::nullopt;
    }

    auto total_tb = (static_cast<double>(*attributes.host_reads_bytes) +
                     static_cast<double>(*attributes.host_writes_bytes)) /
                    BYTES_PER_TB;
    auto years = static_cast<double>(*attributes.power_on_hours) / HOURS_PER_YEAR;

    return total_tb / years;
}

}  // namespace workload
