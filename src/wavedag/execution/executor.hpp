/**
 * @file executor.hpp
 * @brief IWorkflowExecutor interface, ExecutorConfig and WorkflowExecutor.
 */
#pragma once
#include "wavedag/common/common.hpp"
#include "wavedag/common/step_definition.hpp"
#include "wavedag/events/workflow_events.hpp"
#include "wavedag/execution/checkpoint_store.hpp"
#include "wavedag/execution/execution_result.hpp"
#include "wavedag/execution/step_runner.hpp"
#include <tbb/task_arena.h>
#include <condition_variable>

namespace wavedag
{

/**
 * @brief Configuration for executor behavior.
 */
struct ExecutorConfig
{
    /**
     * @brief Number of worker threads for the parallel group of a wave.
     * @details 0 lets TBB choose from the available hardware threads.
     */
    size_t max_workers{4};

    /**
     * @brief Whether to take a checkpoint after each failure-free wave.
     */
    bool auto_checkpoint{true};

    /**
     * @brief Whether to stop the run at the first failed step.
     * @details If true, steps not yet started are marked Skipped.
     *          If false, steps that do not depend on the failed one continue.
     */
    bool stop_on_failure{true};

    /**
     * @brief Whether to reject invalid step sets before running anything.
     */
    bool validate_workflow{true};

    TimeoutPolicy timeout_policy{TimeoutPolicy::Ignore};

    /**
     * @brief History size for an event bus created from this config.
     */
    size_t event_history_limit{500};

    /**
     * @brief spdlog level name applied by the application ("trace" .. "off").
     */
    std::string log_level{"info"};
};

/**
 * @brief Interface for workflow executors.
 *
 * @par Thread Safety
 * - execute() and rollback() may be called from any thread.
 */
class IWorkflowExecutor
{
public:
    virtual ~IWorkflowExecutor() = default;

    /**
     * @brief Run a step set to completion.
     *
     * @param steps The steps; ids must be unique.
     * @param workflow_type Label carried on events and checkpoint metadata.
     * @param initial_state Initial shared state; ignored when resuming.
     * @param resume_from_checkpoint Restore results and state from this
     *        checkpoint; its Completed steps are not run again.
     * @return The aggregate result. Every submitted step has a terminal
     *         entry in `step_results`.
     *
     * @throws WorkflowError (ExecutorShutdown) after shutdown. Every other
     *         failure, including an unknown checkpoint id, is reported as a
     *         Failed result.
     */
    virtual ExecutionResult execute(const std::vector<StepDefinition>& steps,
                                    const std::string& workflow_type = "",
                                    ValueMap initial_state = {},
                                    const std::optional<std::string>& resume_from_checkpoint = std::nullopt) = 0;

    /**
     * @brief Undo completed steps.
     *
     * @param steps The step definitions the results came from.
     * @param step_results Results of a previous run; updated in place.
     * @param reason Free text carried on the rollback events.
     * @param rollback_to_checkpoint Keep the steps that were already
     *        Completed in this checkpoint.
     *
     * @throws WorkflowError (CheckpointNotFound) if the checkpoint is unknown.
     */
    virtual ExecutionResult rollback(const std::vector<StepDefinition>& steps,
                                     StepResultMap& step_results,
                                     const std::string& reason = "",
                                     const std::optional<std::string>& rollback_to_checkpoint = std::nullopt) = 0;
};

/**
 * @brief Wave-based executor backed by a bounded TBB task arena.
 *
 * @details
 * Each iteration of execute() computes the ready set, runs its parallel
 * group inside the arena (at most max_workers steps at once, the calling
 * thread included) and waits for all of it, then runs its
 * sequential group one step at a time on the calling thread. The next wave
 * starts only when every step of the current one is terminal.
 *
 * Checkpoints taken by any run are kept in the executor's registry until
 * clear_checkpoints().
 *
 * @par Thread Safety
 * - All public methods may be called from any thread.
 * - Concurrent execute() calls share the arena.
 */
class WorkflowExecutor : public IWorkflowExecutor
{
public:
    /**
     * @param config Configuration options.
     * @param bus Receives lifecycle events; null means events are discarded.
     */
    explicit WorkflowExecutor(ExecutorConfig config = {}, EventBusPtr bus = nullptr);
    ~WorkflowExecutor() override;

    // Non-copyable
    WorkflowExecutor(const WorkflowExecutor&) = delete;
    WorkflowExecutor& operator=(const WorkflowExecutor&) = delete;

    ExecutionResult execute(const std::vector<StepDefinition>& steps,
                            const std::string& workflow_type = "",
                            ValueMap initial_state = {},
                            const std::optional<std::string>& resume_from_checkpoint = std::nullopt) override;

    ExecutionResult rollback(const std::vector<StepDefinition>& steps,
                             StepResultMap& step_results,
                             const std::string& reason = "",
                             const std::optional<std::string>& rollback_to_checkpoint = std::nullopt) override;

    /**
     * @brief Set the callback invoked once per executed step.
     * @note Takes effect for runs started afterwards.
     */
    void set_progress_callback(ProgressCallback callback);

    /**
     * @return The checkpoint, or nullptr if unknown.
     */
    CheckpointPtr get_checkpoint(const std::string& checkpoint_id) const;

    /**
     * @brief All retained checkpoints, oldest first.
     */
    std::vector<CheckpointPtr> list_checkpoints() const;

    void clear_checkpoints();

    /**
     * @brief Stop accepting runs and wait for the ones in progress.
     * @details Later execute() calls throw. Idempotent.
     * @note Must not be called from a step action or progress callback.
     */
    void shutdown();

    bool is_shut_down() const noexcept
    {
        return m_shut_down.load(std::memory_order_acquire);
    }

    const ExecutorConfig& config() const noexcept
    {
        return m_config;
    }

private:
    /**
     * @brief Mutable bookkeeping of one execute() call.
     */
    struct RunState;

    void run_waves(const std::vector<StepDefinition>& steps, RunState& run, ExecutionResult& result);

    std::vector<StepResult> run_parallel(const std::vector<const StepDefinition*>& group,
                                         const StepRunner& runner,
                                         RunState& run);

    void abort_run(const std::vector<StepDefinition>& steps,
                   RunState& run,
                   ExecutionResult& result,
                   const std::string& reason);

    void take_checkpoint(RunState& run, ExecutionResult& result);

    ExecutorConfig m_config;
    EventBusPtr m_bus;
    CheckpointStore m_checkpoints;
    std::unique_ptr<tbb::task_arena> m_arena;
    std::atomic<bool> m_shut_down{false};

    std::mutex m_run_mutex;
    std::condition_variable m_runs_done;
    size_t m_active_runs{0};

    mutable std::mutex m_callback_mutex;
    ProgressCallback m_progress;
};

/**
 * @brief Factory function to create a WorkflowExecutor.
 * @param config Configuration options.
 * @param bus Event bus; null discards events.
 * @return Shared pointer to the executor.
 */
inline std::shared_ptr<WorkflowExecutor> make_workflow_executor(ExecutorConfig config = {},
                                                                EventBusPtr bus = nullptr)
{
    return std::make_shared<WorkflowExecutor>(std::move(config), std::move(bus));
}

} // namespace wavedag
