#include "wavedag/execution/step_runner.hpp"
#include "wavedag/events/event_bus.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace wavedag
{

StepRunner::StepRunner(EventBusPtr bus, TimeoutPolicy timeout_policy, ProgressCallback progress)
    : m_bus{std::move(bus)}
    , m_timeout_policy{timeout_policy}
    , m_progress{std::move(progress)}
{}

StepResult StepRunner::run(const StepDefinition& step,
                           WorkflowState& state,
                           const std::string& workflow_type,
                           size_t wave) const
{
    StepResult result;
    result.step_id = step.step_id;
    result.status = StepStatus::Running;
    result.wave = wave;
    result.started_at = WallClock::now();
    auto start_time = std::chrono::steady_clock::now();

    publish_quietly(m_bus.get(), WorkflowEvent::step_started(workflow_type, step.step_id, step.name));

    const int retry_count = std::max(0, step.retry_count);
    int failed_attempts = 0;
    std::string last_error;
    ValueMap output;
    bool succeeded = false;

    if (!step.action)
    {
        last_error = "Step has no action";
        failed_attempts = 1;
    }
    else
    {
        for (int attempt_no = 0; attempt_no <= retry_count; ++attempt_no)
        {
            output.clear();
            auto error = attempt(step, state, output);
            if (!error)
            {
                succeeded = true;
                break;
            }

            ++failed_attempts;
            last_error = std::move(*error);
            SPDLOG_WARN("Step '{}' attempt {}/{} failed: {}",
                        step.step_id, attempt_no + 1, retry_count + 1, last_error);
        }
    }

    result.completed_at = WallClock::now();
    result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time);
    result.retry_attempts = std::min(failed_attempts, retry_count);

    if (succeeded)
    {
        result.status = StepStatus::Completed;
        result.output = std::move(output);
        SPDLOG_DEBUG("Step '{}' completed after {} attempt(s)", step.step_id, failed_attempts + 1);
        publish_quietly(m_bus.get(), WorkflowEvent::step_completed(
            workflow_type, step.step_id, step.name, result.duration, result.output));
    }
    else
    {
        result.status = StepStatus::Failed;
        result.error = last_error;
        SPDLOG_ERROR("Step '{}' failed after {} attempt(s): {}",
                     step.step_id, failed_attempts, last_error);
        publish_quietly(m_bus.get(), WorkflowEvent::step_failed(
            workflow_type, step.step_id, step.name, result.duration, result.error));
    }

    report_progress(result);
    return result;
}

std::optional<std::string> StepRunner::attempt(const StepDefinition& step,
                                               WorkflowState& state,
                                               ValueMap& output) const
{
    auto attempt_start = std::chrono::steady_clock::now();
    try
    {
        StepStateView view(state, step.step_id);
        output = step.action->run(step.params, view);
    }
    catch (const std::exception& e)
    {
        return std::string{e.what()};
    }
    catch (...)
    {
        return std::string{"Unknown exception"};
    }

    if (step.timeout_seconds)
    {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - attempt_start;
        if (elapsed.count() > *step.timeout_seconds)
        {
            if (m_timeout_policy == TimeoutPolicy::FailAttempt)
            {
                return fmt::format("Step exceeded timeout of {}s", *step.timeout_seconds);
            }
            SPDLOG_WARN("Step '{}' took {:.3f}s, exceeding its timeout of {}s",
                        step.step_id, elapsed.count(), *step.timeout_seconds);
        }
    }
    return std::nullopt;
}

void StepRunner::report_progress(const StepResult& result) const
{
    if (!m_progress)
    {
        return;
    }
    try
    {
        m_progress(result.step_id, result);
    }
    catch (const std::exception& e)
    {
        SPDLOG_ERROR("Progress callback failed for step '{}': {}", result.step_id, e.what());
    }
    catch (...)
    {
        SPDLOG_ERROR("Progress callback failed for step '{}': Unknown exception", result.step_id);
    }
}

} // namespace wavedag
