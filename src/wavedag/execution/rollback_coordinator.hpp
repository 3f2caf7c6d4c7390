/**
 * @file rollback_coordinator.hpp
 * @brief Runs compensating actions for completed steps.
 */
#pragma once
#include "wavedag/common/common.hpp"
#include "wavedag/common/step_definition.hpp"
#include "wavedag/events/workflow_events.hpp"
#include "wavedag/execution/execution_result.hpp"

namespace wavedag
{

/**
 * @brief Undoes completed steps in reverse completion order.
 *
 * @details
 * Candidates are the steps Completed in `results`. When a checkpoint is
 * given, steps that were already Completed in that checkpoint are kept.
 *
 * Candidates are visited by descending `StepResult::sequence`; steps that
 * carry no sequence come last, in reverse submission order. For each:
 * - without a rollback action, the step stays Completed;
 * - if the action returns, the step becomes RolledBack;
 * - if it throws, "Rollback failed for <id>: <error>" is collected, the
 *   step stays Completed, and the remaining candidates are still visited.
 *
 * Rollback actions are not retried.
 */
class RollbackCoordinator
{
public:
    explicit RollbackCoordinator(EventBusPtr bus);

    /**
     * @param steps The submitted step definitions (actions and params).
     * @param results Live results; updated in place.
     * @param reason Free text carried on the rollback events.
     * @param checkpoint Boundary checkpoint, or nullptr to undo everything.
     * @return Status RolledBack; `success` iff no rollback action failed.
     */
    ExecutionResult rollback(const std::vector<StepDefinition>& steps,
                             StepResultMap& results,
                             const std::string& reason,
                             const Checkpoint* checkpoint) const;

    /**
     * @brief Candidate step ids in the order they would be rolled back.
     */
    static std::vector<StepId> rollback_order(const std::vector<StepDefinition>& steps,
                                              const StepResultMap& results,
                                              const Checkpoint* checkpoint);

private:
    EventBusPtr m_bus;
};

} // namespace wavedag
