/**
 * @file yaml_export.hpp
 * @brief YAML representations of results and checkpoints, for reporting.
 */
#pragma once
#include "wavedag/common/step_result.hpp"
#include "wavedag/common/value.hpp"
#include "wavedag/execution/checkpoint.hpp"
#include "wavedag/execution/execution_result.hpp"
#include <yaml-cpp/yaml.h>

namespace wavedag
{

/**
 * @brief ISO-8601 UTC text with millisecond precision, e.g. "2024-05-01T12:00:00.250Z".
 */
std::string format_timestamp(WallTime time);

YAML::Node to_yaml(const Value& value);
YAML::Node to_yaml(const ValueMap& values);

/**
 * @details Keys: step_id, status, started_at, completed_at, output, error,
 *          retry_attempts, duration_ms, wave, sequence. Absent timestamps
 *          are null.
 */
YAML::Node to_yaml(const StepResult& result);

/**
 * @details Keys: checkpoint_id, created_at, wave, step_results,
 *          workflow_state, state_ownership, completion_order, metadata.
 */
YAML::Node to_yaml(const Checkpoint& checkpoint);

/**
 * @details Keys: success, message, status, step_results, checkpoint_id,
 *          started_at, completed_at, duration_ms, errors, completion_order,
 *          final_state.
 */
YAML::Node to_yaml(const ExecutionResult& result);

/**
 * @brief Emit a node as block-style YAML text.
 */
std::string dump_yaml(const YAML::Node& node);

} // namespace wavedag
