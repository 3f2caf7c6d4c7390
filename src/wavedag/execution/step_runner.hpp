/**
 * @file step_runner.hpp
 * @brief StepRunner drives one step through its attempts.
 */
#pragma once
#include "wavedag/common/common.hpp"
#include "wavedag/common/step_definition.hpp"
#include "wavedag/common/step_result.hpp"
#include "wavedag/common/workflow_state.hpp"
#include "wavedag/events/workflow_events.hpp"

namespace wavedag
{

/**
 * @brief Called once per executed step with its terminal result.
 */
using ProgressCallback = std::function<void(const StepId&, const StepResult&)>;

/**
 * @brief Runs a single step with retries, timing and notifications.
 *
 * @details
 * run() performs the full lifecycle of one step:
 * 1. Record `started_at`, publish StepStarted
 * 2. Call the action up to `retry_count + 1` times, stopping at the first
 *    success; there is no delay between attempts
 * 3. Apply the timeout policy to each attempt that returned
 * 4. Record `completed_at` and `duration`
 * 5. Publish StepCompleted or StepFailed
 * 6. Invoke the progress callback
 *
 * A step never propagates an exception out of run(): errors are captured as
 * `what()` of the exception, or "Unknown exception" for anything else, and
 * the step ends Failed. Event bus and progress callback failures are logged.
 *
 * @par Thread Safety
 * - run() may be called concurrently for different steps.
 */
class StepRunner
{
public:
    StepRunner(EventBusPtr bus, TimeoutPolicy timeout_policy, ProgressCallback progress);

    /**
     * @brief Execute one step to its terminal result.
     * @param step The step to run.
     * @param state Shared state of the run.
     * @param workflow_type Label carried on the published events.
     * @param wave 1-based wave index recorded in the result.
     * @return Completed or Failed result. `sequence` is left for the caller.
     */
    StepResult run(const StepDefinition& step,
                   WorkflowState& state,
                   const std::string& workflow_type,
                   size_t wave) const;

private:
    /**
     * @brief One call of the action.
     * @return Error message, or std::nullopt on success.
     */
    std::optional<std::string> attempt(const StepDefinition& step,
                                       WorkflowState& state,
                                       ValueMap& output) const;

    void report_progress(const StepResult& result) const;

    EventBusPtr m_bus;
    TimeoutPolicy m_timeout_policy;
    ProgressCallback m_progress;
};

} // namespace wavedag
