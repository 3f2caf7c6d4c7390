/**
 * @file workflow_exceptions.hpp
 */
#pragma once
#include "wavedag/common/common.hpp"

namespace wavedag
{

/**
 * @brief Error codes for executor, checkpoint and state operations.
 */
enum class WorkflowErrorCode
{
    CheckpointNotFound,
    InvalidWorkflow,
    StateOwnershipViolation,
    ExecutorShutdown,
    InvalidConfig
};

inline const char* to_string(WorkflowErrorCode code) noexcept
{
    switch (code)
    {
        case WorkflowErrorCode::CheckpointNotFound: return "CheckpointNotFound";
        case WorkflowErrorCode::InvalidWorkflow: return "InvalidWorkflow";
        case WorkflowErrorCode::StateOwnershipViolation: return "StateOwnershipViolation";
        case WorkflowErrorCode::ExecutorShutdown: return "ExecutorShutdown";
        case WorkflowErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

/**
 * @brief Exception class for workflow engine errors.
 *
 * @details
 * `WorkflowError` is thrown when a caller-facing precondition fails: an
 * unknown checkpoint id, a step set that does not validate, a state write
 * against another step's key, use of a shut-down executor, or a bad
 * configuration. Failures of step actions themselves never surface as
 * `WorkflowError`; they are recorded as Failed step results.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class WorkflowError : public std::exception
{
public:
    /**
     * @brief Construct a WorkflowError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    WorkflowError(WorkflowErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    WorkflowErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    WorkflowErrorCode m_code;
    std::string m_message;
};

} // namespace wavedag
