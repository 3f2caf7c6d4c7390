/**
 * @file workflow_events.hpp
 * @brief WorkflowEvent record and the IEventBus boundary.
 */
#pragma once
#include "wavedag/common/common.hpp"
#include "wavedag/common/value.hpp"
#include "wavedag/common/workflow_enums.hpp"

namespace wavedag
{

/**
 * @brief A lifecycle notification emitted by the executor.
 *
 * @details
 * One record type serves every WorkflowEventType; fields that do not apply
 * to a given type are left empty:
 * - Step events: `step_id`, `step_name`; `duration` on completion/failure,
 *   `output` on completion, `error` on failure.
 * - CheckpointCreated: `checkpoint_id`.
 * - Rollback events: `rollback_reason`, `checkpoint_id` (if any);
 *   `steps_rolled_back` on completion.
 */
struct WorkflowEvent
{
    WorkflowEventType type{WorkflowEventType::StepStarted};
    WallTime timestamp{WallClock::now()};
    std::string source{"wavedag"};
    std::string workflow_type;

    StepId step_id;
    std::string step_name;
    std::chrono::nanoseconds duration{0};
    ValueMap output;
    std::string error;

    std::string checkpoint_id;
    std::string rollback_reason;
    size_t steps_rolled_back{0};

    /**
     * @brief Hierarchical key of the event type, e.g. "workflow:step:failed".
     */
    std::string key() const
    {
        return to_string(type);
    }

    static WorkflowEvent step_started(std::string workflow_type, StepId step_id, std::string step_name)
    {
        WorkflowEvent event;
        event.type = WorkflowEventType::StepStarted;
        event.workflow_type = std::move(workflow_type);
        event.step_id = std::move(step_id);
        event.step_name = std::move(step_name);
        return event;
    }

    static WorkflowEvent step_completed(std::string workflow_type, StepId step_id, std::string step_name,
                                        std::chrono::nanoseconds duration, ValueMap output)
    {
        WorkflowEvent event;
        event.type = WorkflowEventType::StepCompleted;
        event.workflow_type = std::move(workflow_type);
        event.step_id = std::move(step_id);
        event.step_name = std::move(step_name);
        event.duration = duration;
        event.output = std::move(output);
        return event;
    }

    static WorkflowEvent step_failed(std::string workflow_type, StepId step_id, std::string step_name,
                                     std::chrono::nanoseconds duration, std::string error)
    {
        WorkflowEvent event;
        event.type = WorkflowEventType::StepFailed;
        event.workflow_type = std::move(workflow_type);
        event.step_id = std::move(step_id);
        event.step_name = std::move(step_name);
        event.duration = duration;
        event.error = std::move(error);
        return event;
    }

    static WorkflowEvent checkpoint_created(std::string workflow_type, std::string checkpoint_id)
    {
        WorkflowEvent event;
        event.type = WorkflowEventType::CheckpointCreated;
        event.workflow_type = std::move(workflow_type);
        event.checkpoint_id = std::move(checkpoint_id);
        return event;
    }

    static WorkflowEvent rollback_started(std::string reason, std::string checkpoint_id)
    {
        WorkflowEvent event;
        event.type = WorkflowEventType::RollbackStarted;
        event.rollback_reason = std::move(reason);
        event.checkpoint_id = std::move(checkpoint_id);
        return event;
    }

    static WorkflowEvent rollback_completed(std::string reason, std::string checkpoint_id,
                                            size_t steps_rolled_back)
    {
        WorkflowEvent event;
        event.type = WorkflowEventType::RollbackCompleted;
        event.rollback_reason = std::move(reason);
        event.checkpoint_id = std::move(checkpoint_id);
        event.steps_rolled_back = steps_rolled_back;
        return event;
    }
};

/**
 * @brief Outbound boundary for lifecycle notifications.
 *
 * @details
 * publish() is fire-and-forget: the executor does not retry, buffer, or
 * wait for acknowledgement, and an exception escaping publish() is logged
 * by the executor and otherwise ignored.
 *
 * @par Thread Safety
 * - publish() is called from worker threads, concurrently for the steps of
 *   one wave. Implementations must be thread-safe.
 */
class IEventBus
{
public:
    virtual ~IEventBus() = default;

    virtual void publish(const WorkflowEvent& event) = 0;
};

using EventBusPtr = std::shared_ptr<IEventBus>;

} // namespace wavedag
