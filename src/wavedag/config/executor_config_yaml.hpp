/**
 * @file executor_config_yaml.hpp
 * @brief YAML decoding of ExecutorConfig.
 *
 * @details
 * Recognised keys, all optional:
 * @code{.yaml}
 * max_workers: 4
 * auto_checkpoint: true
 * stop_on_failure: true
 * validate_workflow: true
 * timeout_policy: ignore        # or fail_attempt
 * event_history_limit: 500
 * log_level: info
 * @endcode
 * Missing keys keep their default. Unknown keys are ignored.
 */
#pragma once
#include "wavedag/execution/executor.hpp"
#include <yaml-cpp/yaml.h>

namespace wavedag
{

/**
 * @brief Parse a timeout policy name ("ignore", "fail_attempt").
 * @throws WorkflowError (InvalidConfig) for any other name.
 */
TimeoutPolicy parse_timeout_policy(const std::string& name);

/**
 * @brief Load an ExecutorConfig from a YAML file.
 * @throws WorkflowError (InvalidConfig) if the file cannot be read or parsed,
 *         or holds an invalid value.
 */
ExecutorConfig load_executor_config(const std::string& path);

/**
 * @brief Load an ExecutorConfig from YAML text.
 * @throws WorkflowError (InvalidConfig) as load_executor_config().
 */
ExecutorConfig parse_executor_config(const std::string& yaml_text);

} // namespace wavedag

namespace YAML
{
template <>
struct convert<wavedag::ExecutorConfig>
{
    static Node encode(const wavedag::ExecutorConfig& rhs);

    /**
     * @throws wavedag::WorkflowError (InvalidConfig) for out-of-range values.
     */
    static bool decode(const Node& node, wavedag::ExecutorConfig& rhs);
};
} // namespace YAML
