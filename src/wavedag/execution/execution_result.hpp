/**
 * @file execution_result.hpp
 * @brief Definition of ExecutionResult returned by execute() and rollback().
 */
#pragma once
#include "wavedag/common/common.hpp"
#include "wavedag/common/step_result.hpp"
#include "wavedag/execution/checkpoint.hpp"

namespace wavedag
{

/**
 * @brief Result of a workflow run or of a rollback.
 *
 * @details
 * ExecutionResult captures:
 * - Overall success and status
 * - The final result of every submitted step
 * - The latest checkpoint taken during the run, if any
 * - Timing and the error messages collected along the way
 *
 * After execute(), every submitted step has an entry in `step_results`
 * with status Completed, Failed or Skipped.
 */
struct ExecutionResult
{
    /**
     * @brief True iff `errors` is empty.
     */
    bool success{false};

    /**
     * @brief Human-readable outcome.
     */
    std::string message;

    ExecutionStatus status{ExecutionStatus::Pending};

    StepResultMap step_results;

    /**
     * @brief Latest checkpoint of the run, or null.
     */
    CheckpointPtr checkpoint;

    std::optional<WallTime> started_at;
    std::optional<WallTime> completed_at;
    std::chrono::nanoseconds duration{0};

    std::vector<std::string> errors;

    /**
     * @brief Completed step ids in completion order.
     */
    std::vector<StepId> completion_order;

    /**
     * @brief Shared state at the end of the run.
     */
    ValueMap final_state;

    size_t count(StepStatus status_filter) const
    {
        return static_cast<size_t>(std::count_if(
            step_results.begin(), step_results.end(),
            [status_filter](const auto& entry) { return entry.second.status == status_filter; }));
    }

    size_t completed_count() const
    {
        return count(StepStatus::Completed);
    }

    size_t total_steps() const noexcept
    {
        return step_results.size();
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = "Workflow ";
        result += to_string(status);
        result += " (completed=" + std::to_string(count(StepStatus::Completed));
        result += ", failed=" + std::to_string(count(StepStatus::Failed));
        result += ", skipped=" + std::to_string(count(StepStatus::Skipped));
        result += ", rolled_back=" + std::to_string(count(StepStatus::RolledBack));
        result += ", errors=" + std::to_string(errors.size()) + ")";
        if (!message.empty())
        {
            result += ": " + message;
        }
        return result;
    }
};

} // namespace wavedag
