/**
 * @file step_definition.hpp
 * @brief Interfaces for step and rollback actions, and the StepDefinition record.
 */
#pragma once
#include "wavedag/common/common.hpp"
#include "wavedag/common/value.hpp"
#include "wavedag/common/workflow_enums.hpp"
#include "wavedag/common/workflow_state.hpp"

namespace wavedag
{

/**
 * @brief Interface for the business logic of one workflow step.
 *
 * @details
 * IStepAction is supplied by the caller, typically one implementing class
 * per kind of business step. The executor calls run() once per attempt,
 * possibly from a worker thread and concurrently with other steps of the
 * same wave.
 *
 * @par Thread Safety
 * - run() must be safe to call from any thread.
 * - Implementations should not hold locks during run() that other steps of
 *   the same wave may need.
 *
 * @par Lifecycle
 * - Created by user code and attached to a StepDefinition.
 * - Object lifetime managed via shared_ptr.
 */
class IStepAction
{
public:
    virtual ~IStepAction() = 0;

    /**
     * @brief Execute this step's work.
     *
     * @param params The step's parameters as given in its definition.
     * @param state The run's shared state, seen from this step.
     * @return The step's output.
     *
     * @throws Any exception to indicate failure. The exception is caught by
     *         the executor; its what() becomes the step's error and the
     *         attempt counts against the step's retry budget.
     */
    virtual ValueMap run(const ValueMap& params, StepStateView& state) = 0;

protected:
    IStepAction() = default;

private:
    IStepAction(const IStepAction&) = delete;
    IStepAction(IStepAction&&) = delete;
    IStepAction& operator=(const IStepAction&) = delete;
    IStepAction& operator=(IStepAction&&) = delete;
};

/**
 * @brief Interface for the compensating action of one workflow step.
 *
 * @details
 * rollback() receives only the step's original params. It sees neither the
 * step's output nor the run's state.
 */
class IRollbackAction
{
public:
    virtual ~IRollbackAction() = 0;

    /**
     * @brief Undo the step's side effects.
     * @throws Any exception to indicate failure; the failure is reported in
     *         the rollback result and the remaining rollbacks still run.
     */
    virtual void rollback(const ValueMap& params) = 0;

protected:
    IRollbackAction() = default;

private:
    IRollbackAction(const IRollbackAction&) = delete;
    IRollbackAction(IRollbackAction&&) = delete;
    IRollbackAction& operator=(const IRollbackAction&) = delete;
    IRollbackAction& operator=(IRollbackAction&&) = delete;
};

inline IStepAction::~IStepAction() = default;
inline IRollbackAction::~IRollbackAction() = default;

using StepActionPtr = std::shared_ptr<IStepAction>;
using RollbackActionPtr = std::shared_ptr<IRollbackAction>;

/**
 * @brief IStepAction adapter over a callable.
 */
class LambdaStepAction : public IStepAction
{
public:
    using Function = std::function<ValueMap(const ValueMap&, StepStateView&)>;

    explicit LambdaStepAction(Function fn)
        : m_fn{std::move(fn)}
    {}

    ValueMap run(const ValueMap& params, StepStateView& state) override
    {
        return m_fn(params, state);
    }

private:
    Function m_fn;
};

/**
 * @brief IRollbackAction adapter over a callable.
 */
class LambdaRollbackAction : public IRollbackAction
{
public:
    using Function = std::function<void(const ValueMap&)>;

    explicit LambdaRollbackAction(Function fn)
        : m_fn{std::move(fn)}
    {}

    void rollback(const ValueMap& params) override
    {
        m_fn(params);
    }

private:
    Function m_fn;
};

inline StepActionPtr make_step_action(LambdaStepAction::Function fn)
{
    return std::make_shared<LambdaStepAction>(std::move(fn));
}

inline RollbackActionPtr make_rollback_action(LambdaRollbackAction::Function fn)
{
    return std::make_shared<LambdaRollbackAction>(std::move(fn));
}

/**
 * @brief Immutable description of one unit of work.
 *
 * @details
 * `step_id` must be unique within a submitted step set and every entry of
 * `dependencies` should name another step of the same set; the executor
 * checks both when workflow validation is enabled.
 *
 * `is_required` is carried for callers and reporting; the executor treats
 * every step the same way regardless of it.
 */
struct StepDefinition
{
    StepId step_id;
    std::string name;
    StepActionPtr action;
    std::vector<StepId> dependencies;

    /// False forces the step into the sequential group of its wave.
    bool can_run_parallel{true};

    bool is_required{true};

    /// Deadline per attempt; see TimeoutPolicy. Never interrupts the step.
    std::optional<double> timeout_seconds;

    /// Additional attempts after the first failed one.
    int retry_count{0};

    RollbackActionPtr rollback;
    ValueMap params;
};

} // namespace wavedag
