/**
 * @file step_result.hpp
 * @brief Definition of StepResult, the recorded outcome of one step.
 */
#pragma once
#include "wavedag/common/common.hpp"
#include "wavedag/common/value.hpp"
#include "wavedag/common/workflow_enums.hpp"

namespace wavedag
{

/**
 * @brief Outcome of one step within a run.
 *
 * @details
 * Only the final attempt is kept: `retry_attempts` counts the failed attempts
 * before the final outcome (capped at the step's retry_count) and `error`
 * holds the last error.
 *
 * `wave` and `sequence` record where the step sits in the actual execution
 * order. Rollback walks steps in descending `sequence`, and a checkpoint
 * taken after wave N covers exactly the steps with `wave <= N`.
 */
struct StepResult
{
    StepId step_id;
    StepStatus status{StepStatus::Pending};
    std::optional<WallTime> started_at;
    std::optional<WallTime> completed_at;
    ValueMap output;
    std::string error;
    int retry_attempts{0};
    std::chrono::nanoseconds duration{0};

    /// 1-based wave the step ran in; 0 if it never ran.
    size_t wave{0};

    /// 1-based completion order across the run; 0 if it did not complete.
    size_t sequence{0};

    bool is_completed() const noexcept { return status == StepStatus::Completed; }
    bool is_failed() const noexcept { return status == StepStatus::Failed; }
    bool is_skipped() const noexcept { return status == StepStatus::Skipped; }

    static StepResult skipped(StepId step_id, std::string reason)
    {
        StepResult result;
        result.step_id = std::move(step_id);
        result.status = StepStatus::Skipped;
        result.error = std::move(reason);
        return result;
    }
};

/**
 * @brief Step results keyed by step id.
 */
using StepResultMap = std::map<StepId, StepResult>;

} // namespace wavedag
