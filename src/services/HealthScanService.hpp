/**
 * @file HealthScanService.hpp
 * @brief Discovery -> probe -> normalize -> grade, for a whole batch
 */

#pragma once

#include "grading/GradingEngine.hpp"
#include "interfaces/IDiscoveryService.hpp"
#include "models/GradeResult.hpp"
#include "models/ThresholdPolicy.hpp"
#include "normalizers/TelemetryNormalizer.hpp"
#include "util/Error.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <vector>

/**
 * @struct ScanOptions
 * @brief Concurrency settings for one batch
 */
struct ScanOptions {
    size_t worker_count = 0;                          ///< 0 selects max(4, CPU count)
    std::chrono::milliseconds device_timeout{30'000};  ///< Probe + normalize + grade budget
};

/**
 * @class HealthScanService
 * @brief Grades every discovered device, one outcome per device
 *
 * Probes run on a ProbePool. Normalization and grading run on the same
 * worker right after the probe. Whatever happens to one device (open
 * failure, timeout, bad JSON, an exception while normalizing) becomes an
 * Error/DataReadError result for that device only; the batch always
 * returns exactly one result per discovered device, in discovery order.
 */
class HealthScanService {
public:
    HealthScanService(std::shared_ptr<IDiscoveryService> discovery, ThresholdPolicy policy,
                      ScanOptions options = {});
    ~HealthScanService() = default;

    HealthScanService(const HealthScanService&) = delete;
    HealthScanService& operator=(const HealthScanService&) = delete;

    /**
     * @brief Run a full batch
     * @param cancel_flag Checked before each device probe starts; devices
     *                    not yet started when it is set report Error
     * @return One GradedDevice per discovered device, or an error if
     *         enumeration itself failed
     */
    [[nodiscard]] auto scan(const std::atomic<bool>& cancel_flag)
        -> std::expected<std::vector<GradedDevice>, util::Error>;

    /**
     * @brief Probe, normalize and grade one candidate
     *
     * Never throws; failures are folded into the returned result.
     */
    [[nodiscard]] auto evaluate(const DeviceCandidate& candidate) const -> GradedDevice;

    /**
     * @brief Error result for a device that produced no usable telemetry
     */
    [[nodiscard]] static auto failed_device(DeviceIdentity identity, const util::Error& error)
        -> GradedDevice;

    [[nodiscard]] auto options() const -> const ScanOptions& { return options_; }

private:
    std::shared_ptr<IDiscoveryService> discovery_;
    TelemetryNormalizer normalizer_;
    GradingEngine engine_;
    ScanOptions options_;
};
