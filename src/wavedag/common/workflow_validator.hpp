/**
 * @file workflow_validator.hpp
 * @brief Submission-time diagnostics for a step set.
 */
#pragma once
#include "wavedag/common/common.hpp"
#include "wavedag/common/step_definition.hpp"

namespace wavedag
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue that may indicate a problem.
    Error     ///< Blocking issue; the step set is rejected.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    DuplicateStepId,        ///< Two steps share an id.
    MissingAction,          ///< A step has no action to run.
    UnknownDependency,      ///< A dependency names no step of the set.
    SelfDependency,         ///< A step depends on itself.
    Cycle,                  ///< The dependencies contain a cycle.
    DuplicateDependency,    ///< The same dependency is listed twice.
    NegativeRetryCount      ///< retry_count < 0; treated as 0.
};

/**
 * @brief A single diagnostic item (error or warning).
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Steps involved in this issue, in submission order.
    std::vector<StepId> involved_steps;
};

// ============================================================================
// WorkflowDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected from a step set.
 *
 * @details
 * Produced by `WorkflowValidator::validate()`.
 *
 * @par Error vs Warning
 * - **Errors** make the executor reject the step set before any step runs:
 *   DuplicateStepId, MissingAction, UnknownDependency, SelfDependency, Cycle.
 * - **Warnings** are logged only: DuplicateDependency, NegativeRetryCount.
 *
 * @par Thread safety
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class WorkflowDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief All items, errors first then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result;
        result.reserve(m_errors.size() + m_warnings.size());
        result.insert(result.end(), m_errors.begin(), m_errors.end());
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

    friend class WorkflowValidator;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

/**
 * @brief Checks a step set for structural problems.
 */
class WorkflowValidator
{
public:
    /**
     * @brief Diagnose a step set.
     * @param steps The steps as they would be submitted to execute().
     * @return Diagnostics; never null.
     */
    static std::shared_ptr<WorkflowDiagnostics> validate(const std::vector<StepDefinition>& steps);

private:
    static void detect_cycles(const std::vector<StepDefinition>& steps,
                              WorkflowDiagnostics& diagnostics);
};

} // namespace wavedag
