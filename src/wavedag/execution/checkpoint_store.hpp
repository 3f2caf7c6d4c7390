/**
 * @file checkpoint_store.hpp
 * @brief In-memory registry of checkpoints.
 */
#pragma once
#include "wavedag/execution/checkpoint.hpp"
#include <random>

namespace wavedag
{

/**
 * @brief Registry of every checkpoint taken by one executor.
 *
 * @details
 * Checkpoints are retained until clear() is called. Nothing is persisted;
 * the registry lives and dies with its owner.
 *
 * Ids have the form `ckpt-<n>-<16 hex digits>`, where `n` counts checkpoints
 * created by this store and the suffix is random, so ids stay unique across
 * clear() calls and across stores.
 *
 * @par Thread Safety
 * - create(), get(), require(), list(), size() and clear() are serialized
 *   by a single mutex.
 * - Returned checkpoints are immutable and safe to share across threads.
 */
class CheckpointStore
{
public:
    CheckpointStore();

    CheckpointStore(const CheckpointStore&) = delete;
    CheckpointStore& operator=(const CheckpointStore&) = delete;

    /**
     * @brief Snapshot and register.
     * @param snapshot The checkpoint contents; `checkpoint_id` and
     *        `created_at` are assigned here.
     * @return The registered, now immutable, checkpoint.
     */
    CheckpointPtr create(Checkpoint snapshot);

    /**
     * @brief Look up by id.
     * @return The checkpoint, or nullptr if unknown.
     */
    CheckpointPtr get(const std::string& checkpoint_id) const;

    /**
     * @brief Look up by id.
     * @throws WorkflowError (CheckpointNotFound) if unknown.
     */
    CheckpointPtr require(const std::string& checkpoint_id) const;

    /**
     * @brief All registered checkpoints, in creation order.
     */
    std::vector<CheckpointPtr> list() const;

    size_t size() const;

    void clear();

private:
    std::string next_id_locked();

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, CheckpointPtr> m_by_id;
    std::vector<CheckpointPtr> m_ordered;
    size_t m_created{0};
    std::mt19937_64 m_rng;
};

} // namespace wavedag
