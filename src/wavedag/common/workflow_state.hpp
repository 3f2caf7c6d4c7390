/**
 * @file workflow_state.hpp
 * @brief Shared workflow state with per-key ownership, and the per-step view onto it.
 */
#pragma once
#include "wavedag/common/common.hpp"
#include "wavedag/common/value.hpp"
#include "wavedag/common/workflow_enums.hpp"

namespace wavedag
{

/**
 * @brief Maps each owned state key to the id of the step that owns it.
 */
using StateOwnership = std::map<std::string, StepId>;

/**
 * @brief Key/value state shared by every step of one run.
 *
 * @details
 * All steps of a run, including the ones running concurrently inside a wave,
 * see the same WorkflowState. Every operation takes the internal mutex, so
 * single reads and writes are atomic.
 *
 * @par Ownership
 * The first step that writes (or erases) a key becomes its owner for the
 * rest of the run. A later write or erase of that key by any other step
 * throws `WorkflowError` with code `StateOwnershipViolation`. Keys supplied
 * as initial state start unowned. Reads are never restricted.
 *
 * Ownership only guards individual keys. Invariants spanning several keys
 * written by different parallel steps are the caller's responsibility.
 *
 * @par Thread Safety
 * - All methods are safe to call concurrently.
 * - Non-copyable; snapshots are taken with snapshot() and ownership().
 */
class WorkflowState
{
public:
    WorkflowState() = default;

    /**
     * @brief Construct with initial, unowned values.
     */
    explicit WorkflowState(ValueMap initial);

    /**
     * @brief Construct from a snapshot, restoring ownership.
     */
    WorkflowState(ValueMap values, StateOwnership owners);

    WorkflowState(const WorkflowState&) = delete;
    WorkflowState& operator=(const WorkflowState&) = delete;

    /**
     * @brief Look up a key.
     * @return The value, or std::nullopt if the key is absent.
     */
    std::optional<Value> get(const std::string& key) const;

    bool contains(const std::string& key) const;

    /**
     * @brief Write a key on behalf of a step.
     * @param writer Id of the writing step.
     * @throws WorkflowError (StateOwnershipViolation) if another step owns the key.
     */
    void set(const StepId& writer, const std::string& key, Value value);

    /**
     * @brief Remove a key on behalf of a step.
     * @return True if the key existed.
     * @throws WorkflowError (StateOwnershipViolation) if another step owns the key.
     */
    bool erase(const StepId& writer, const std::string& key);

    /**
     * @brief Independent copy of all values.
     */
    ValueMap snapshot() const;

    /**
     * @brief Independent copy of the ownership table.
     */
    StateOwnership ownership() const;

    /**
     * @brief Owner of a key, if any step has claimed it.
     */
    std::optional<StepId> owner_of(const std::string& key) const;

    size_t size() const;

private:
    void claim_locked(const StepId& writer, const std::string& key);

    mutable std::mutex m_mutex;
    ValueMap m_values;
    StateOwnership m_owners;
};

/**
 * @brief The state as seen from inside one step.
 *
 * @details
 * A StepStateView is created by the executor for each attempt and passed to
 * `IStepAction::run()`. Writes go through it so that ownership is attributed
 * to the running step. It holds a reference to the run's WorkflowState and
 * must not outlive the call it was passed to.
 */
class StepStateView
{
public:
    StepStateView(WorkflowState& state, StepId step_id);

    std::optional<Value> get(const std::string& key) const
    {
        return m_state.get(key);
    }

    /**
     * @brief Look up a key, falling back when absent.
     */
    Value get_or(const std::string& key, Value fallback) const;

    bool contains(const std::string& key) const
    {
        return m_state.contains(key);
    }

    /**
     * @throws WorkflowError (StateOwnershipViolation) if another step owns the key.
     */
    void set(const std::string& key, Value value)
    {
        m_state.set(m_step_id, key, std::move(value));
    }

    /**
     * @throws WorkflowError (StateOwnershipViolation) if another step owns the key.
     */
    bool erase(const std::string& key)
    {
        return m_state.erase(m_step_id, key);
    }

    ValueMap snapshot() const
    {
        return m_state.snapshot();
    }

    const StepId& step_id() const noexcept
    {
        return m_step_id;
    }

private:
    WorkflowState& m_state;
    StepId m_step_id;
};

} // namespace wavedag
