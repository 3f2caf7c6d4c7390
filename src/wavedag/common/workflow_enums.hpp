/**
 * @file workflow_enums.hpp
 */
#pragma once
#include "wavedag/common/common.hpp"

namespace wavedag
{

// ============================================================================
// Type aliases
// ============================================================================

/**
 * @brief Type alias for step identifiers.
 *
 * @details
 * Step ids are caller-chosen strings, unique within one submitted step set.
 * This alias exists for clarity in API signatures and documentation, not for
 * compile-time type safety.
 */
using StepId = std::string;

/**
 * @brief Wall clock used for the timestamps recorded in results and checkpoints.
 */
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Lifecycle status of a single step.
 *
 * @details
 * A step without an entry in the result map is implicitly Pending. Running
 * is only observable from inside the run. Completed and Failed are reached
 * after the last attempt; Skipped when a dependency is unmet or failed, or
 * when the run halted. RolledBack is only reached through an explicit
 * rollback of a Completed step.
 */
enum class StepStatus
{
    Pending,
    Running,
    Completed,
    Failed,
    Skipped,
    RolledBack
};

/**
 * @brief Status of a whole workflow run or rollback.
 *
 * @note Paused is part of the status vocabulary but no operation of the
 *       executor produces it.
 */
enum class ExecutionStatus
{
    Pending,
    Running,
    Completed,
    Failed,
    RolledBack,
    Paused
};

/**
 * @brief Lifecycle notifications published on the event bus.
 */
enum class WorkflowEventType
{
    StepStarted,
    StepCompleted,
    StepFailed,
    CheckpointCreated,
    RollbackStarted,
    RollbackCompleted
};

/**
 * @brief How `StepDefinition::timeout_seconds` is honoured.
 *
 * @details
 * Steps are never interrupted. With `Ignore` an overrun is logged only. With
 * `FailAttempt` an attempt that returns after its deadline counts as a failed
 * attempt and is subject to the step's retry budget.
 */
enum class TimeoutPolicy
{
    Ignore,
    FailAttempt
};

// ============================================================================
// String conversions
// ============================================================================

inline const char* to_string(StepStatus status) noexcept
{
    switch (status)
    {
        case StepStatus::Pending: return "pending";
        case StepStatus::Running: return "running";
        case StepStatus::Completed: return "completed";
        case StepStatus::Failed: return "failed";
        case StepStatus::Skipped: return "skipped";
        case StepStatus::RolledBack: return "rolled_back";
    }
    return "unknown";
}

inline const char* to_string(ExecutionStatus status) noexcept
{
    switch (status)
    {
        case ExecutionStatus::Pending: return "pending";
        case ExecutionStatus::Running: return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Failed: return "failed";
        case ExecutionStatus::RolledBack: return "rolled_back";
        case ExecutionStatus::Paused: return "paused";
    }
    return "unknown";
}

/**
 * @brief Hierarchical event key, e.g. "workflow:step:started".
 * @details Pattern subscriptions on the event bus match against this key.
 */
inline const char* to_string(WorkflowEventType type) noexcept
{
    switch (type)
    {
        case WorkflowEventType::StepStarted: return "workflow:step:started";
        case WorkflowEventType::StepCompleted: return "workflow:step:completed";
        case WorkflowEventType::StepFailed: return "workflow:step:failed";
        case WorkflowEventType::CheckpointCreated: return "workflow:checkpoint:created";
        case WorkflowEventType::RollbackStarted: return "workflow:rollback:started";
        case WorkflowEventType::RollbackCompleted: return "workflow:rollback:completed";
    }
    return "workflow:unknown";
}

inline const char* to_string(TimeoutPolicy policy) noexcept
{
    switch (policy)
    {
        case TimeoutPolicy::Ignore: return "ignore";
        case TimeoutPolicy::FailAttempt: return "fail_attempt";
    }
    return "unknown";
}

/**
 * @brief True for the statuses the wave scheduler never revisits.
 */
inline bool is_terminal(StepStatus status) noexcept
{
    return status == StepStatus::Completed ||
           status == StepStatus::Failed ||
           status == StepStatus::Skipped;
}

} // namespace wavedag
