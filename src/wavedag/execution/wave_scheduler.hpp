/**
 * @file wave_scheduler.hpp
 * @brief Ready-set computation for wave-based execution.
 */
#pragma once
#include "wavedag/common/common.hpp"
#include "wavedag/common/step_definition.hpp"
#include "wavedag/common/step_result.hpp"

namespace wavedag
{

/**
 * @brief The ready steps of one wave, split by execution mode.
 *
 * @details
 * Both groups keep submission order. The parallel group runs first with
 * bounded concurrency; the sequential group runs after it, one step at a
 * time.
 */
struct Wave
{
    std::vector<const StepDefinition*> parallel;
    std::vector<const StepDefinition*> sequential;

    bool empty() const noexcept
    {
        return parallel.empty() && sequential.empty();
    }

    size_t size() const noexcept
    {
        return parallel.size() + sequential.size();
    }
};

/**
 * @brief Stateless helpers that decide what runs next.
 */
class WaveScheduler
{
public:
    /**
     * @brief Steps whose dependencies are all satisfied.
     *
     * @details
     * A step is ready iff:
     * - it is not in `completed`,
     * - it has no terminal entry (Completed, Failed, Skipped) in `results`,
     * - every dependency is in `completed`,
     * - no dependency has a Failed entry in `results`.
     *
     * @return Pointers into `steps`, in submission order.
     */
    static std::vector<const StepDefinition*> find_ready(const std::vector<StepDefinition>& steps,
                                                         const std::unordered_set<StepId>& completed,
                                                         const StepResultMap& results);

    /**
     * @brief Split ready steps by `can_run_parallel`, preserving order.
     */
    static Wave partition(const std::vector<const StepDefinition*>& ready);

    /**
     * @brief Steps with no terminal entry in `results`, in submission order.
     */
    static std::vector<StepId> unresolved(const std::vector<StepDefinition>& steps,
                                          const StepResultMap& results);

    /**
     * @brief Record every unresolved step as Skipped.
     * @return Number of steps marked.
     */
    static size_t mark_unresolved_skipped(const std::vector<StepDefinition>& steps,
                                          StepResultMap& results,
                                          const std::string& reason);
};

} // namespace wavedag
