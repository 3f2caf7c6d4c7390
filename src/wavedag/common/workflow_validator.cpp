#include "wavedag/common/workflow_validator.hpp"
#include <queue>

namespace wavedag
{

std::shared_ptr<WorkflowDiagnostics> WorkflowValidator::validate(
    const std::vector<StepDefinition>& steps)
{
    auto diagnostics = std::make_shared<WorkflowDiagnostics>();

    // =========================================================================
    // Phase 1: Per-step checks
    // =========================================================================

    std::unordered_set<StepId> seen;
    std::unordered_set<StepId> known;
    for (const auto& step : steps)
    {
        known.insert(step.step_id);
    }

    for (const auto& step : steps)
    {
        if (!seen.insert(step.step_id).second)
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Error;
            item.category = DiagnosticCategory::DuplicateStepId;
            item.message = "Duplicate step id '" + step.step_id + "'";
            item.involved_steps.push_back(step.step_id);
            diagnostics->m_errors.push_back(std::move(item));
        }

        if (!step.action)
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Error;
            item.category = DiagnosticCategory::MissingAction;
            item.message = "Step '" + step.step_id + "' has no action";
            item.involved_steps.push_back(step.step_id);
            diagnostics->m_errors.push_back(std::move(item));
        }

        if (step.retry_count < 0)
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Warning;
            item.category = DiagnosticCategory::NegativeRetryCount;
            item.message = "Step '" + step.step_id + "' has negative retry_count " +
                           std::to_string(step.retry_count) + "; no retries will be made";
            item.involved_steps.push_back(step.step_id);
            diagnostics->m_warnings.push_back(std::move(item));
        }

        std::unordered_set<StepId> listed;
        for (const auto& dep : step.dependencies)
        {
            if (dep == step.step_id)
            {
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Error;
                item.category = DiagnosticCategory::SelfDependency;
                item.message = "Step '" + step.step_id + "' depends on itself";
                item.involved_steps.push_back(step.step_id);
                diagnostics->m_errors.push_back(std::move(item));
            }
            else if (known.count(dep) == 0)
            {
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Error;
                item.category = DiagnosticCategory::UnknownDependency;
                item.message = "Step '" + step.step_id + "' depends on unknown step '" + dep + "'";
                item.involved_steps.push_back(step.step_id);
                diagnostics->m_errors.push_back(std::move(item));
            }

            if (!listed.insert(dep).second)
            {
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Warning;
                item.category = DiagnosticCategory::DuplicateDependency;
                item.message = "Step '" + step.step_id + "' lists dependency '" + dep + "' more than once";
                item.involved_steps.push_back(step.step_id);
                diagnostics->m_warnings.push_back(std::move(item));
            }
        }
    }

    // =========================================================================
    // Phase 2: Cycle detection
    // =========================================================================

    detect_cycles(steps, *diagnostics);

    return diagnostics;
}

void WorkflowValidator::detect_cycles(const std::vector<StepDefinition>& steps,
                                      WorkflowDiagnostics& diagnostics)
{
    // Index the first occurrence of each id; duplicates are reported above.
    std::unordered_map<StepId, size_t> index_of;
    std::vector<size_t> nodes;
    for (size_t i = 0; i < steps.size(); ++i)
    {
        if (index_of.emplace(steps[i].step_id, i).second)
        {
            nodes.push_back(i);
        }
    }

    if (nodes.empty())
    {
        return;
    }

    // Kahn's algorithm over dependency edges (dep -> step). Self-loops are
    // already reported and unknown ids have no node.
    std::vector<size_t> in_degree(steps.size(), 0);
    std::vector<std::vector<size_t>> successors(steps.size());

    for (size_t i : nodes)
    {
        std::unordered_set<StepId> unique_deps(steps[i].dependencies.begin(),
                                               steps[i].dependencies.end());
        for (const auto& dep : unique_deps)
        {
            auto it = index_of.find(dep);
            if (it == index_of.end() || it->second == i)
            {
                continue;
            }
            successors[it->second].push_back(i);
            ++in_degree[i];
        }
    }

    std::queue<size_t> ready;
    for (size_t i : nodes)
    {
        if (in_degree[i] == 0)
        {
            ready.push(i);
        }
    }

    size_t processed = 0;
    while (!ready.empty())
    {
        size_t s = ready.front();
        ready.pop();
        ++processed;

        for (size_t succ : successors[s])
        {
            --in_degree[succ];
            if (in_degree[succ] == 0)
            {
                ready.push(succ);
            }
        }
    }

    // If not all steps were processed, there's a cycle
    if (processed < nodes.size())
    {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Error;
        item.category = DiagnosticCategory::Cycle;

        // Steps on a cycle, plus steps downstream of one, keep in-degree > 0
        for (size_t i : nodes)
        {
            if (in_degree[i] > 0)
            {
                item.involved_steps.push_back(steps[i].step_id);
            }
        }

        item.message = "Cycle detected in step dependencies among:";
        for (const auto& id : item.involved_steps)
        {
            item.message += " '" + id + "'";
        }
        diagnostics.m_errors.push_back(std::move(item));
    }
}

} // namespace wavedag
