#include "wavedag/execution/executor.hpp"
#include "wavedag/common/workflow_exceptions.hpp"
#include "wavedag/common/workflow_validator.hpp"
#include "wavedag/events/event_bus.hpp"
#include "wavedag/execution/rollback_coordinator.hpp"
#include "wavedag/execution/wave_scheduler.hpp"
#include <numeric>
#include <spdlog/spdlog.h>
#include <tbb/parallel_for_each.h>
#include <tbb/task_arena.h>

namespace wavedag
{

namespace
{

const char* const kStoppedReason = "Workflow stopped due to prior failure";
const char* const kDependenciesNotMet = "Dependencies not met";

void finish_timing(ExecutionResult& result, std::chrono::steady_clock::time_point start_time)
{
    result.completed_at = WallClock::now();
    result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time);
}

} // namespace

struct WorkflowExecutor::RunState
{
    std::string workflow_type;
    std::unique_ptr<WorkflowState> state;
    std::unordered_set<StepId> completed;
    size_t wave{0};
    size_t sequence{0};
    bool aborted{false};
};

WorkflowExecutor::WorkflowExecutor(ExecutorConfig config, EventBusPtr bus)
    : m_config{std::move(config)}
    , m_bus{bus ? std::move(bus) : make_null_event_bus()}
    , m_arena{std::make_unique<tbb::task_arena>(
          m_config.max_workers == 0 ? tbb::task_arena::automatic
                                    : static_cast<int>(m_config.max_workers))}
{}

WorkflowExecutor::~WorkflowExecutor()
{
    shutdown();
}

ExecutionResult WorkflowExecutor::execute(const std::vector<StepDefinition>& steps,
                                          const std::string& workflow_type,
                                          ValueMap initial_state,
                                          const std::optional<std::string>& resume_from_checkpoint)
{
    {
        std::lock_guard<std::mutex> lock(m_run_mutex);
        if (is_shut_down())
        {
            throw WorkflowError(WorkflowErrorCode::ExecutorShutdown,
                                "Cannot execute a workflow on a shut down executor");
        }
        ++m_active_runs;
    }
    struct ActiveRun
    {
        WorkflowExecutor& executor;
        ~ActiveRun()
        {
            std::lock_guard<std::mutex> lock(executor.m_run_mutex);
            if (--executor.m_active_runs == 0)
            {
                executor.m_runs_done.notify_all();
            }
        }
    } active_run{*this};

    ExecutionResult result;
    result.status = ExecutionStatus::Running;
    result.started_at = WallClock::now();
    auto start_time = std::chrono::steady_clock::now();

    SPDLOG_INFO("Starting workflow '{}' with {} step(s)", workflow_type, steps.size());

    RunState run;
    run.workflow_type = workflow_type;

    try
    {
        if (m_config.validate_workflow)
        {
            auto diagnostics = WorkflowValidator::validate(steps);
            for (const auto& item : diagnostics->warnings())
            {
                SPDLOG_WARN("Workflow '{}': {}", workflow_type, item.message);
            }
            if (!diagnostics->is_valid())
            {
                const std::string reason = "Invalid workflow: " + diagnostics->errors().front().message;
                for (const auto& item : diagnostics->errors())
                {
                    result.errors.push_back(item.message);
                    SPDLOG_ERROR("Workflow '{}': {}", workflow_type, item.message);
                }
                WaveScheduler::mark_unresolved_skipped(steps, result.step_results, reason);
                result.status = ExecutionStatus::Failed;
                result.success = false;
                result.message = reason;
                finish_timing(result, start_time);
                return result;
            }
        }

        if (resume_from_checkpoint)
        {
            CheckpointPtr checkpoint = m_checkpoints.require(*resume_from_checkpoint);
            result.step_results = checkpoint->step_results;
            for (const auto& [id, step_result] : checkpoint->step_results)
            {
                if (step_result.status == StepStatus::Completed)
                {
                    run.completed.insert(id);
                }
            }
            result.completion_order = checkpoint->completion_order;
            result.checkpoint = checkpoint;
            run.state = std::make_unique<WorkflowState>(checkpoint->workflow_state,
                                                        checkpoint->state_ownership);
            run.wave = checkpoint->wave;
            run.sequence = checkpoint->completion_order.size();
            SPDLOG_INFO("Resuming workflow '{}' from checkpoint {} ({} step(s) already completed)",
                        workflow_type, checkpoint->checkpoint_id, run.completed.size());
        }
        else
        {
            run.state = std::make_unique<WorkflowState>(std::move(initial_state));
        }

        run_waves(steps, run, result);

        WaveScheduler::mark_unresolved_skipped(
            steps, result.step_results, run.aborted ? kStoppedReason : kDependenciesNotMet);
    }
    catch (const std::exception& e)
    {
        abort_run(steps, run, result, e.what());
        finish_timing(result, start_time);
        return result;
    }
    catch (...)
    {
        abort_run(steps, run, result, "Unknown exception");
        finish_timing(result, start_time);
        return result;
    }

    for (const auto& step : steps)
    {
        const auto& step_result = result.step_results.at(step.step_id);
        if (step_result.status == StepStatus::Failed)
        {
            result.errors.push_back("Step '" + step.step_id + "' failed: " + step_result.error);
        }
    }

    bool any_failed = std::any_of(result.step_results.begin(), result.step_results.end(),
                                  [](const auto& entry) { return entry.second.status == StepStatus::Failed; });
    result.status = any_failed ? ExecutionStatus::Failed : ExecutionStatus::Completed;
    result.success = result.errors.empty();
    result.message = result.success
        ? std::string{"Workflow completed successfully"}
        : "Workflow failed: " + std::to_string(result.errors.size()) + " error(s)";
    result.final_state = run.state->snapshot();
    finish_timing(result, start_time);

    SPDLOG_INFO("Workflow '{}' finished: {}", workflow_type, result.summary());
    return result;
}

void WorkflowExecutor::abort_run(const std::vector<StepDefinition>& steps,
                                 RunState& run,
                                 ExecutionResult& result,
                                 const std::string& reason)
{
    SPDLOG_ERROR("Workflow '{}' aborted: {}", run.workflow_type, reason);
    WaveScheduler::mark_unresolved_skipped(steps, result.step_results, reason);
    result.errors.push_back(reason);
    result.status = ExecutionStatus::Failed;
    result.success = false;
    result.message = reason;
    if (run.state)
    {
        result.final_state = run.state->snapshot();
    }
}

void WorkflowExecutor::run_waves(const std::vector<StepDefinition>& steps, RunState& run, ExecutionResult& result)
{
    ProgressCallback progress;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        progress = m_progress;
    }
    StepRunner runner(m_bus, m_config.timeout_policy, std::move(progress));

    auto record = [&](StepResult step_result) {
        if (step_result.status == StepStatus::Completed)
        {
            step_result.sequence = ++run.sequence;
            run.completed.insert(step_result.step_id);
            result.completion_order.push_back(step_result.step_id);
        }
        StepId step_id = step_result.step_id;
        result.step_results[step_id] = std::move(step_result);
    };

    while (true)
    {
        auto ready = WaveScheduler::find_ready(steps, run.completed, result.step_results);
        if (ready.empty())
        {
            break;
        }

        Wave wave = WaveScheduler::partition(ready);
        ++run.wave;
        SPDLOG_DEBUG("Wave {}: {} parallel, {} sequential step(s)",
                     run.wave, wave.parallel.size(), wave.sequential.size());

        bool wave_failed = false;

        if (!wave.parallel.empty())
        {
            for (auto& step_result : run_parallel(wave.parallel, runner, run))
            {
                wave_failed = wave_failed || step_result.status == StepStatus::Failed;
                record(std::move(step_result));
            }
        }

        if (!(wave_failed && m_config.stop_on_failure))
        {
            for (const StepDefinition* step : wave.sequential)
            {
                StepResult step_result = runner.run(*step, *run.state, run.workflow_type, run.wave);
                bool failed = step_result.status == StepStatus::Failed;
                record(std::move(step_result));
                if (failed)
                {
                    wave_failed = true;
                    if (m_config.stop_on_failure)
                    {
                        break;
                    }
                }
            }
        }

        if (wave_failed && m_config.stop_on_failure)
        {
            SPDLOG_WARN("Stopping workflow '{}' after a failure in wave {}", run.workflow_type, run.wave);
            run.aborted = true;
            break;
        }

        if (!wave_failed && m_config.auto_checkpoint)
        {
            take_checkpoint(run, result);
        }
    }
}

std::vector<StepResult> WorkflowExecutor::run_parallel(const std::vector<const StepDefinition*>& group,
                                                       const StepRunner& runner,
                                                       RunState& run)
{
    std::vector<StepResult> results(group.size());
    std::vector<size_t> slots(group.size());
    std::iota(slots.begin(), slots.end(), size_t{0});

    // The arena caps how many of the group's steps run at once
    m_arena->execute([&]() {
        tbb::parallel_for_each(slots.begin(), slots.end(), [&](size_t slot) {
            results[slot] = runner.run(*group[slot], *run.state, run.workflow_type, run.wave);
        });
    });

    // Completion order within the group follows the recorded finish times
    std::stable_sort(results.begin(), results.end(),
                     [](const StepResult& a, const StepResult& b) {
                         return a.completed_at < b.completed_at;
                     });
    return results;
}

void WorkflowExecutor::take_checkpoint(RunState& run, ExecutionResult& result)
{
    Checkpoint snapshot;
    snapshot.wave = run.wave;
    snapshot.step_results = result.step_results;
    snapshot.workflow_state = run.state->snapshot();
    snapshot.state_ownership = run.state->ownership();
    snapshot.completion_order = result.completion_order;
    snapshot.metadata["workflow_type"] = run.workflow_type;
    snapshot.metadata["wave"] = static_cast<long long>(run.wave);
    snapshot.metadata["completed_count"] = static_cast<long long>(run.completed.size());

    result.checkpoint = m_checkpoints.create(std::move(snapshot));
    SPDLOG_DEBUG("Created checkpoint {} after wave {}", result.checkpoint->checkpoint_id, run.wave);

    publish_quietly(m_bus.get(),
                    WorkflowEvent::checkpoint_created(run.workflow_type, result.checkpoint->checkpoint_id));
}

ExecutionResult WorkflowExecutor::rollback(const std::vector<StepDefinition>& steps,
                                           StepResultMap& step_results,
                                           const std::string& reason,
                                           const std::optional<std::string>& rollback_to_checkpoint)
{
    CheckpointPtr checkpoint;
    if (rollback_to_checkpoint)
    {
        checkpoint = m_checkpoints.require(*rollback_to_checkpoint);
    }

    RollbackCoordinator coordinator(m_bus);
    return coordinator.rollback(steps, step_results, reason, checkpoint.get());
}

void WorkflowExecutor::set_progress_callback(ProgressCallback callback)
{
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_progress = std::move(callback);
}

CheckpointPtr WorkflowExecutor::get_checkpoint(const std::string& checkpoint_id) const
{
    return m_checkpoints.get(checkpoint_id);
}

std::vector<CheckpointPtr> WorkflowExecutor::list_checkpoints() const
{
    return m_checkpoints.list();
}

void WorkflowExecutor::clear_checkpoints()
{
    m_checkpoints.clear();
}

void WorkflowExecutor::shutdown()
{
    std::unique_lock<std::mutex> lock(m_run_mutex);
    if (m_shut_down.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    m_runs_done.wait(lock, [this]() { return m_active_runs == 0; });
    SPDLOG_DEBUG("Workflow executor shut down");
}

} // namespace wavedag
