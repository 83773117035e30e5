/**
 * @file TelemetryNormalizer.cpp
 * @brief Dispatches raw telemetry to the adapter for its protocol
 */

#include "normalizers/TelemetryNormalizer.hpp"

#include "normalizers/AtaAdapter.hpp"
#include "normalizers/NvmeAdapter.hpp"
#include "normalizers/ScsiAdapter.hpp"

#include <algorithm>

TelemetryNormalizer::TelemetryNormalizer() {
    // USB/unknown devices try these in order; SCSI data is the least specific
    adapters_.push_back(std::make_unique<NvmeAdapter>());
    adapters_.push_back(std::make_unique<AtaAdapter>());
    adapters_.push_back(std::make_unique<ScsiAdapter>());
}

TelemetryNormalizer::TelemetryNormalizer(std::vector<std::unique_ptr<ITelemetryAdapter>> adapters)
    : adapters_(std::move(adapters)) {}

auto TelemetryNormalizer::select(const DeviceIdentity& identity,
                                 const nlohmann::json& document) const
    -> const ITelemetryAdapter* {
    if (identity.protocol == Protocol::ATA || identity.protocol == Protocol::NVME ||
        identity.protocol == Protocol::SCSI) {
        auto it = std::ranges::find_if(adapters_, [&](const auto& adapter) {
            return adapter->protocol() == identity.protocol;
        });
        return it != adapters_.end() ? it->get() : nullptr;
    }

    auto it = std::ranges::find_if(
        adapters_, [&](const auto& adapter) { return adapter->recognizes(document); });
    return it != adapters_.end() ? it->get() : nullptr;
}

auto TelemetryNormalizer::normalize(const DeviceIdentity& identity, const RawTelemetry& raw) const
    -> CanonicalAttributes {
    const auto* adapter = select(identity, raw.document);
    if (adapter == nullptr) {
        CanonicalAttributes empty;
        empty.protocol = identity.protocol;
        return empty;
    }
    return adapter->normalize(identity, raw);
}
