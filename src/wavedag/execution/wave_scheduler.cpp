#include "wavedag/execution/wave_scheduler.hpp"

namespace wavedag
{

namespace
{

bool has_terminal_entry(const StepResultMap& results, const StepId& step_id)
{
    auto it = results.find(step_id);
    return it != results.end() && is_terminal(it->second.status);
}

bool has_failed_entry(const StepResultMap& results, const StepId& step_id)
{
    auto it = results.find(step_id);
    return it != results.end() && it->second.status == StepStatus::Failed;
}

} // namespace

std::vector<const StepDefinition*> WaveScheduler::find_ready(const std::vector<StepDefinition>& steps,
                                                             const std::unordered_set<StepId>& completed,
                                                             const StepResultMap& results)
{
    std::vector<const StepDefinition*> ready;
    for (const auto& step : steps)
    {
        if (completed.count(step.step_id) > 0 || has_terminal_entry(results, step.step_id))
        {
            continue;
        }

        bool satisfied = std::all_of(
            step.dependencies.begin(), step.dependencies.end(),
            [&](const StepId& dep) {
                return completed.count(dep) > 0 && !has_failed_entry(results, dep);
            });

        if (satisfied)
        {
            ready.push_back(&step);
        }
    }
    return ready;
}

Wave WaveScheduler::partition(const std::vector<const StepDefinition*>& ready)
{
    Wave wave;
    for (const StepDefinition* step : ready)
    {
        if (step->can_run_parallel)
        {
            wave.parallel.push_back(step);
        }
        else
        {
            wave.sequential.push_back(step);
        }
    }
    return wave;
}

std::vector<StepId> WaveScheduler::unresolved(const std::vector<StepDefinition>& steps,
                                              const StepResultMap& results)
{
    std::vector<StepId> ids;
    for (const auto& step : steps)
    {
        if (!has_terminal_entry(results, step.step_id))
        {
            ids.push_back(step.step_id);
        }
    }
    return ids;
}

size_t WaveScheduler::mark_unresolved_skipped(const std::vector<StepDefinition>& steps,
                                              StepResultMap& results,
                                              const std::string& reason)
{
    size_t marked = 0;
    for (const auto& step_id : unresolved(steps, results))
    {
        results[step_id] = StepResult::skipped(step_id, reason);
        ++marked;
    }
    return marked;
}

} // namespace wavedag
