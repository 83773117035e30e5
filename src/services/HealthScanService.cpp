/**
 * @file HealthScanService.cpp
 * @brief Discovery -> probe -> normalize -> grade, for a whole batch
 */

#include "services/HealthScanService.hpp"

#include "normalizers/IdentityParser.hpp"
#include "services/ProbePool.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace {

constexpr std::string_view COMPONENT = "HealthScan";

auto describe(const GradeResult& grade) -> std::string {
    if (grade.failure_reason) {
        return std::format("{} ({})", grade_status_to_string(grade.status),
                           failure_reason_to_string(*grade.failure_reason));
    }
    if (grade.flag_reason) {
        return std::format("{} ({})", grade_status_to_string(grade.status),
                           flag_reason_to_string(*grade.flag_reason));
    }
    return std::string(grade_status_to_string(grade.status));
}

}  // namespace

HealthScanService::HealthScanService(std::shared_ptr<IDiscoveryService> discovery,
                                     ThresholdPolicy policy, ScanOptions options)
    : discovery_(std::move(discovery)), engine_(std::move(policy)), options_(options) {}

auto HealthScanService::failed_device(DeviceIdentity identity, const util::Error& error)
    -> GradedDevice {
    CanonicalAttributes attributes;
    attributes.protocol = identity.protocol;

    return GradedDevice{.identity = std::move(identity),
                        .attributes = std::move(attributes),
                        .grade = GradeResult::read_error(),
                        .detail = error.message};
}

auto HealthScanService::evaluate(const DeviceCandidate& candidate) const -> GradedDevice {
    auto identity = IdentityParser::from_candidate(candidate);

    try {
        auto raw = discovery_->probe(candidate);
        if (!raw) {
            return failed_device(std::move(identity), raw.error());
        }

        identity = IdentityParser::parse(candidate, raw->document);
        auto attributes = normalizer_.normalize(identity, *raw);
        auto grade = engine_.grade(attributes);

        std::string detail;
        if (!attributes.telemetry_available) {
            detail = "Device reported no health telemetry";
        }

        LOG_INFO(COMPONENT, std::format("{} [{} {} {}]: {}", candidate.path,
                                        protocol_to_string(identity.protocol), identity.model,
                                        identity.serial, describe(grade)));

        return GradedDevice{.identity = std::move(identity),
                            .attributes = std::move(attributes),
                            .grade = grade,
                            .detail = std::move(detail)};
    } catch (const std::exception& e) {
        LOG_ERROR(COMPONENT, std::format("Evaluating {} failed: {}", candidate.path, e.what()));
        return failed_device(std::move(identity),
                             util::Error{std::format("Evaluation failed: {}", e.what()),
                                         util::ErrorCode::PARSE_FAILED});
    }
}

auto HealthScanService::scan(const std::atomic<bool>& cancel_flag)
    -> std::expected<std::vector<GradedDevice>, util::Error> {
    auto discovered = discovery_->enumerate(cancel_flag);
    if (!discovered) {
        return std::unexpected(discovered.error());
    }

    std::vector<std::pair<size_t, GradedDevice>> outcomes;
    outcomes.reserve(discovered->total());

    for (const auto& failure : discovered->failures) {
        auto identity = IdentityParser::from_candidate(DeviceCandidate{
            .order = failure.order,
            .path = failure.path,
            .device_type = failure.device_type,
            .protocol = failure.protocol});
        outcomes.emplace_back(failure.order, failed_device(std::move(identity), failure.error));
    }

    if (!discovered->devices.empty()) {
        using Pool = ProbePool<GradedDevice>;
        auto worker_count = options_.worker_count > 0 ? options_.worker_count
                                                      : Pool::default_worker_count();

        LOG_INFO(COMPONENT, std::format("Probing {} device(s) on {} worker(s), {} ms per device",
                                        discovered->devices.size(), worker_count,
                                        options_.device_timeout.count()));

        Pool pool(worker_count);
        std::vector<Pool::Ticket> tickets;
        tickets.reserve(discovered->devices.size());

        for (const auto& candidate : discovered->devices) {
            tickets.push_back(pool.submit(candidate.path, [this, candidate, &cancel_flag] {
                if (cancel_flag.load()) {
                    return failed_device(IdentityParser::from_candidate(candidate),
                                         util::Error{"Scan cancelled before probe",
                                                     util::ErrorCode::CANCELLED});
                }
                return evaluate(candidate);
            }));
        }

        for (size_t i = 0; i < tickets.size(); ++i) {
            const auto& candidate = discovered->devices[i];
            auto identity = IdentityParser::from_candidate(candidate);

            try {
                if (auto graded = Pool::wait(tickets[i], options_.device_timeout)) {
                    outcomes.emplace_back(candidate.order, std::move(*graded));
                    continue;
                }
                LOG_WARNING(COMPONENT, std::format("{} exceeded {} ms, marking as read error",
                                                   candidate.path,
                                                   options_.device_timeout.count()));
                outcomes.emplace_back(
                    candidate.order,
                    failed_device(std::move(identity),
                                  util::Error{std::format("Timed out after {} ms",
                                                          options_.device_timeout.count()),
                                              util::ErrorCode::TIMED_OUT}));
            } catch (const std::exception& e) {
                LOG_ERROR(COMPONENT, std::format("Worker for {} failed: {}", candidate.path,
                                                 e.what()));
                outcomes.emplace_back(candidate.order,
                                      failed_device(std::move(identity),
                                                    util::Error{e.what(),
                                                                util::ErrorCode::PARSE_FAILED}));
            } catch (...) {
                LOG_ERROR(COMPONENT, std::format("Worker for {} failed with a non-standard exception",
                                                 candidate.path));
                outcomes.emplace_back(
                    candidate.order,
                    failed_device(std::move(identity),
                                  util::Error{"Evaluation failed with an unknown exception",
                                              util::ErrorCode::PARSE_FAILED}));
            }
        }
        // Pool destructor waits for abandoned probes; the executor's own
        // command timeout bounds how long that takes
    }

    std::ranges::stable_sort(outcomes, {}, &std::pair<size_t, GradedDevice>::first);

    std::vector<GradedDevice> results;
    results.reserve(outcomes.size());
    for (auto& outcome : outcomes) {
        results.push_back(std::move(outcome.second));
    }

    auto failed = std::ranges::count_if(results, [](const GradedDevice& device) {
        return !device.grade.is_pass();
    });
    LOG_INFO(COMPONENT, std::format("Scan finished: {} device(s), {} not passing", results.size(),
                                    failed));
    return results;
}
