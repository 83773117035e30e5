/**
 * @file GradingEngine.cpp
 * @brief Applies a ThresholdPolicy to a canonical health record
 */

#include "grading/GradingEngine.hpp"

#include "normalizers/Workload.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <span>
#include <utility>

namespace {

/**
 * Inputs shared by every rule
 */
struct RuleContext {
    const CanonicalAttributes& attributes;
    const ThresholdPolicy& policy;
    std::optional<double> workload;
};

using Rule = std::optional<GradeResult> (*)(const RuleContext&);

template<typename T, typename Limit>
auto above(const std::optional<T>& value, Limit limit) -> bool {
    return value.has_value() && *value > limit;
}

template<typename T, typename Limit>
auto at_or_below(const std::optional<T>& value, Limit limit) -> bool {
    return value.has_value() && *value <= limit;
}

auto no_telemetry(const RuleContext& ctx) -> std::optional<GradeResult> {
    if (!ctx.attributes.telemetry_available) {
        return GradeResult::read_error();
    }
    return std::nullopt;
}

auto failed_self_test(const RuleContext& ctx) -> std::optional<GradeResult> {
    const auto& outcomes = ctx.attributes.self_test_outcomes;
    if (std::ranges::find(outcomes, SelfTestOutcome::FAILED) != outcomes.end()) {
        return GradeResult::fail(FailureReason::FAILED_SELF_TEST);
    }
    return std::nullopt;
}

auto pending_sectors(const RuleContext& ctx) -> std::optional<GradeResult> {
    if (above(ctx.attributes.pending_sectors, ctx.policy.pending_sectors_max())) {
        return GradeResult::fail(FailureReason::PENDING_SECTORS);
    }
    return std::nullopt;
}

auto reallocated_sectors(const RuleContext& ctx) -> std::optional<GradeResult> {
    if (above(ctx.attributes.reallocated_sectors, ctx.policy.reallocated_sectors_max())) {
        return GradeResult::fail(FailureReason::REALLOCATED_SECTORS);
    }
    return std::nullopt;
}

auto percent_used(const RuleContext& ctx) -> std::optional<GradeResult> {
    if (above(ctx.attributes.percent_used, ctx.policy.percent_used_max())) {
        return GradeResult::fail(FailureReason::PERCENT_USED);
    }
    return std::nullopt;
}

auto available_spare(const RuleContext& ctx) -> std::optional<GradeResult> {
    if (at_or_below(ctx.attributes.available_spare_pct, ctx.policy.available_spare_min())) {
        return GradeResult::fail(FailureReason::AVAILABLE_SPARE);
    }
    return std::nullopt;
}

auto media_errors(const RuleContext& ctx) -> std::optional<GradeResult> {
    if (above(ctx.attributes.uncorrectable_errors, ctx.policy.uncorrectable_errors_max())) {
        return GradeResult::fail(FailureReason::MEDIA_ERRORS);
    }
    return std::nullopt;
}

auto critical_temperature(const RuleContext& ctx) -> std::optional<GradeResult> {
    if (above(ctx.attributes.critical_temp_time, ctx.policy.critical_temp_minutes_max())) {
        return GradeResult::fail(FailureReason::CRITICAL_TEMP);
    }
    return std::nullopt;
}

auto temperature_warning(const RuleContext& ctx) -> std::optional<GradeResult> {
    if (above(ctx.attributes.warning_temp_time, ctx.policy.warning_temp_minutes_max())) {
        return GradeResult::flagged(FlagReason::TEMP_WARNING);
    }
    return std::nullopt;
}

auto heavy_use(const RuleContext& ctx) -> std::optional<GradeResult> {
    if (above(ctx.workload, ctx.policy.workload_tb_per_year_max())) {
        return GradeResult::flagged(FlagReason::HEAVY_USE);
    }
    return std::nullopt;
}

constexpr std::array PRECONDITION_RULES = {no_telemetry, failed_self_test};

constexpr std::array SECTOR_MEDIA_RULES = {pending_sectors, reallocated_sectors, percent_used,
                                           available_spare};

constexpr std::array NVME_RULES = {percent_used, available_spare, media_errors,
                                   critical_temperature};

constexpr std::array FLAG_RULES = {temperature_warning, heavy_use};

auto first_match(std::span<const Rule> rules, const RuleContext& ctx)
    -> std::optional<GradeResult> {
    for (auto rule : rules) {
        if (auto result = rule(ctx)) {
            return result;
        }
    }
    return std::nullopt;
}

auto protocol_rules(const CanonicalAttributes& attributes) -> std::span<const Rule> {
    // A USB bridge in front of an NVMe drive still carries an NVMe health log
    auto protocol = attributes.telemetry_protocol != Protocol::UNKNOWN
                        ? attributes.telemetry_protocol
                        : attributes.protocol;
    if (protocol == Protocol::NVME) {
        return NVME_RULES;
    }
    return SECTOR_MEDIA_RULES;
}

}  // namespace

GradingEngine::GradingEngine(ThresholdPolicy policy) : policy_(std::move(policy)) {}

auto GradingEngine::grade(const CanonicalAttributes& attributes) const -> GradeResult {
    return evaluate(attributes, policy_);
}

auto GradingEngine::evaluate(const CanonicalAttributes& attributes,
                             const ThresholdPolicy& policy) -> GradeResult {
    const RuleContext ctx{.attributes = attributes,
                          .policy = policy,
                          .workload = workload::tb_per_year(attributes)};

    auto result = first_match(PRECONDITION_RULES, ctx)
                      .or_else([&] { return first_match(protocol_rules(attributes), ctx); })
                      .or_else([&] { return first_match(FLAG_RULES, ctx); })
                      .value_or(GradeResult::pass());

    result.workload_tb_per_year = ctx.workload;
    return result;
}
