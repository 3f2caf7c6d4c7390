#include "wavedag/common/workflow_state.hpp"
#include "wavedag/common/workflow_exceptions.hpp"

namespace wavedag
{

WorkflowState::WorkflowState(ValueMap initial)
    : m_values{std::move(initial)}
{}

WorkflowState::WorkflowState(ValueMap values, StateOwnership owners)
    : m_values{std::move(values)}
    , m_owners{std::move(owners)}
{}

std::optional<Value> WorkflowState::get(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool WorkflowState::contains(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values.count(key) > 0;
}

void WorkflowState::set(const StepId& writer, const std::string& key, Value value)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    claim_locked(writer, key);
    m_values[key] = std::move(value);
}

bool WorkflowState::erase(const StepId& writer, const std::string& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    claim_locked(writer, key);
    return m_values.erase(key) > 0;
}

ValueMap WorkflowState::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values;
}

StateOwnership WorkflowState::ownership() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_owners;
}

std::optional<StepId> WorkflowState::owner_of(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_owners.find(key);
    if (it == m_owners.end())
    {
        return std::nullopt;
    }
    return it->second;
}

size_t WorkflowState::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values.size();
}

void WorkflowState::claim_locked(const StepId& writer, const std::string& key)
{
    auto [it, inserted] = m_owners.emplace(key, writer);
    if (!inserted && it->second != writer)
    {
        throw WorkflowError(
            WorkflowErrorCode::StateOwnershipViolation,
            "Step '" + writer + "' cannot modify state key '" + key +
                "' owned by step '" + it->second + "'");
    }
}

StepStateView::StepStateView(WorkflowState& state, StepId step_id)
    : m_state{state}
    , m_step_id{std::move(step_id)}
{}

Value StepStateView::get_or(const std::string& key, Value fallback) const
{
    auto value = m_state.get(key);
    if (!value)
    {
        return fallback;
    }
    return *value;
}

} // namespace wavedag
