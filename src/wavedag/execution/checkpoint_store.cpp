#include "wavedag/execution/checkpoint_store.hpp"
#include "wavedag/common/workflow_exceptions.hpp"
#include <iomanip>
#include <sstream>

namespace wavedag
{

CheckpointStore::CheckpointStore()
    : m_rng{std::random_device{}()}
{}

CheckpointPtr CheckpointStore::create(Checkpoint snapshot)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    snapshot.checkpoint_id = next_id_locked();
    snapshot.created_at = WallClock::now();

    auto checkpoint = std::make_shared<const Checkpoint>(std::move(snapshot));
    m_by_id.emplace(checkpoint->checkpoint_id, checkpoint);
    m_ordered.push_back(checkpoint);
    return checkpoint;
}

CheckpointPtr CheckpointStore::get(const std::string& checkpoint_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_by_id.find(checkpoint_id);
    if (it == m_by_id.end())
    {
        return nullptr;
    }
    return it->second;
}

CheckpointPtr CheckpointStore::require(const std::string& checkpoint_id) const
{
    auto checkpoint = get(checkpoint_id);
    if (!checkpoint)
    {
        throw WorkflowError(WorkflowErrorCode::CheckpointNotFound,
                            "Checkpoint not found: " + checkpoint_id);
    }
    return checkpoint;
}

std::vector<CheckpointPtr> CheckpointStore::list() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ordered;
}

size_t CheckpointStore::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ordered.size();
}

void CheckpointStore::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_by_id.clear();
    m_ordered.clear();
}

std::string CheckpointStore::next_id_locked()
{
    std::ostringstream oss;
    oss << "ckpt-" << ++m_created << "-"
        << std::hex << std::setw(16) << std::setfill('0') << m_rng();
    return oss.str();
}

} // namespace wavedag
