#include "wavedag/execution/rollback_coordinator.hpp"
#include "wavedag/events/event_bus.hpp"
#include <spdlog/spdlog.h>

namespace wavedag
{

RollbackCoordinator::RollbackCoordinator(EventBusPtr bus)
    : m_bus{std::move(bus)}
{}

std::vector<StepId> RollbackCoordinator::rollback_order(const std::vector<StepDefinition>& steps,
                                                        const StepResultMap& results,
                                                        const Checkpoint* checkpoint)
{
    struct Candidate
    {
        size_t sequence;
        size_t submission_index;
        StepId step_id;
    };

    std::unordered_set<StepId> kept;
    if (checkpoint)
    {
        kept = checkpoint->completed_steps();
    }

    std::vector<Candidate> candidates;
    for (size_t i = 0; i < steps.size(); ++i)
    {
        const auto& step_id = steps[i].step_id;
        auto it = results.find(step_id);
        if (it == results.end() || it->second.status != StepStatus::Completed)
        {
            continue;
        }
        if (kept.count(step_id) > 0)
        {
            continue;
        }
        candidates.push_back({it->second.sequence, i, step_id});
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& a, const Candidate& b) {
                  if (a.sequence != b.sequence)
                  {
                      return a.sequence > b.sequence;
                  }
                  return a.submission_index > b.submission_index;
              });

    std::vector<StepId> order;
    order.reserve(candidates.size());
    for (auto& candidate : candidates)
    {
        order.push_back(std::move(candidate.step_id));
    }
    return order;
}

ExecutionResult RollbackCoordinator::rollback(const std::vector<StepDefinition>& steps,
                                              StepResultMap& results,
                                              const std::string& reason,
                                              const Checkpoint* checkpoint) const
{
    ExecutionResult result;
    result.started_at = WallClock::now();
    auto start_time = std::chrono::steady_clock::now();

    const std::string checkpoint_id = checkpoint ? checkpoint->checkpoint_id : std::string{};
    SPDLOG_INFO("Rollback started{}{}: {}",
                checkpoint ? " to checkpoint " : "", checkpoint_id, reason);
    publish_quietly(m_bus.get(), WorkflowEvent::rollback_started(reason, checkpoint_id));

    std::unordered_map<StepId, const StepDefinition*> by_id;
    for (const auto& step : steps)
    {
        by_id.emplace(step.step_id, &step);
    }

    size_t rolled_back = 0;
    for (const auto& step_id : rollback_order(steps, results, checkpoint))
    {
        const StepDefinition* step = by_id.at(step_id);
        if (!step->rollback)
        {
            continue;
        }

        try
        {
            step->rollback->rollback(step->params);
            results[step_id].status = StepStatus::RolledBack;
            ++rolled_back;
            SPDLOG_DEBUG("Rolled back step '{}'", step_id);
        }
        catch (const std::exception& e)
        {
            result.errors.push_back("Rollback failed for " + step_id + ": " + e.what());
            SPDLOG_ERROR("{}", result.errors.back());
        }
        catch (...)
        {
            result.errors.push_back("Rollback failed for " + step_id + ": Unknown exception");
            SPDLOG_ERROR("{}", result.errors.back());
        }
    }

    result.status = ExecutionStatus::RolledBack;
    result.success = result.errors.empty();
    result.message = "Rolled back " + std::to_string(rolled_back) + " step(s)";
    result.step_results = results;
    result.completed_at = WallClock::now();
    result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time);

    publish_quietly(m_bus.get(), WorkflowEvent::rollback_completed(reason, checkpoint_id, rolled_back));
    SPDLOG_INFO("{}", result.summary());
    return result;
}

} // namespace wavedag
