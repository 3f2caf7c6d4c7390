/**
 * @file checkpoint.hpp
 * @brief Definition of Checkpoint, an immutable snapshot of a run.
 */
#pragma once
#include "wavedag/common/common.hpp"
#include "wavedag/common/step_result.hpp"
#include "wavedag/common/value.hpp"
#include "wavedag/common/workflow_state.hpp"

namespace wavedag
{

/**
 * @brief Point-in-time snapshot of step results and shared state.
 *
 * @details
 * Every member is held by value, so a Checkpoint shares nothing with the run
 * it was taken from. Once registered in a CheckpointStore it is only handed
 * out as `shared_ptr<const Checkpoint>`.
 *
 * Resuming from a checkpoint restores `step_results`, `workflow_state`,
 * `state_ownership` and `completion_order`; steps Completed here are not run
 * again.
 */
struct Checkpoint
{
    std::string checkpoint_id;
    WallTime created_at{};

    /// Number of waves completed when the snapshot was taken.
    size_t wave{0};

    StepResultMap step_results;
    ValueMap workflow_state;
    StateOwnership state_ownership;

    /// Completed step ids, oldest first.
    std::vector<StepId> completion_order;

    /// Free-form annotations (workflow_type, wave, completed_count, ...).
    ValueMap metadata;

    /**
     * @brief Ids of the steps that were Completed at snapshot time.
     */
    std::unordered_set<StepId> completed_steps() const
    {
        std::unordered_set<StepId> result;
        for (const auto& [id, sr] : step_results)
        {
            if (sr.status == StepStatus::Completed)
            {
                result.insert(id);
            }
        }
        return result;
    }
};

using CheckpointPtr = std::shared_ptr<const Checkpoint>;

} // namespace wavedag
