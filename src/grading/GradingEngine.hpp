/**
 * @file GradingEngine.hpp
 * @brief Applies a ThresholdPolicy to a canonical health record
 */

#pragma once

#include "models/CanonicalAttributes.hpp"
#include "models/GradeResult.hpp"
#include "models/ThresholdPolicy.hpp"

/**
 * @class GradingEngine
 * @brief Deterministic verdicts from canonical attributes
 *
 * Rules are evaluated in a fixed order and the first one that matches
 * decides the result:
 * 1. no telemetry                          -> Error / DataReadError
 * 2. any failed self-test                  -> Fail / FailedSelfTest
 * 3. ATA, SCSI, USB, unknown: pending, reallocated, percent used, spare
 *    NVMe: percent used, spare, media errors, critical temperature time
 * 4. warning temperature time              -> Pass / TempWarning
 *    workload above limit                  -> Pass / HeavyUse
 * 5.                                       -> Pass
 *
 * A field that was not reported never matches its rule. The workload is
 * attached to every result where it could be derived.
 */
class GradingEngine {
public:
    explicit GradingEngine(ThresholdPolicy policy = ThresholdPolicy{});

    /**
     * @brief Grade with the policy given at construction
     */
    [[nodiscard]] auto grade(const CanonicalAttributes& attributes) const -> GradeResult;

    /**
     * @brief Grade @p attributes against @p policy
     */
    [[nodiscard]] static auto evaluate(const CanonicalAttributes& attributes,
                                       const ThresholdPolicy& policy) -> GradeResult;

    [[nodiscard]] auto policy() const -> const ThresholdPolicy& { return policy_; }

private:
    ThresholdPolicy policy_;
};
