#include "wavedag/serialization/yaml_export.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <ctime>

namespace wavedag
{

namespace
{

double to_milliseconds(std::chrono::nanoseconds duration)
{
    return std::chrono::duration<double, std::milli>(duration).count();
}

YAML::Node optional_timestamp(const std::optional<WallTime>& time)
{
    if (!time)
    {
        return YAML::Node(YAML::NodeType::Null);
    }
    return YAML::Node(format_timestamp(*time));
}

YAML::Node to_yaml_sequence(const std::vector<std::string>& items)
{
    YAML::Node node(YAML::NodeType::Sequence);
    for (const auto& item : items)
    {
        node.push_back(item);
    }
    return node;
}

} // namespace

std::string format_timestamp(WallTime time)
{
    auto since_epoch = time.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds).count();
    if (millis < 0)
    {
        seconds -= std::chrono::seconds{1};
        millis += 1000;
    }

    std::time_t tt = static_cast<std::time_t>(seconds.count());
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(tt), millis);
}

YAML::Node to_yaml(const Value& value)
{
    return std::visit(
        [](const auto& alternative) -> YAML::Node {
            using T = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<T, std::monostate>)
            {
                return YAML::Node(YAML::NodeType::Null);
            }
            else
            {
                return YAML::Node(alternative);
            }
        },
        value.storage());
}

YAML::Node to_yaml(const ValueMap& values)
{
    YAML::Node node(YAML::NodeType::Map);
    for (const auto& [key, value] : values)
    {
        node[key] = to_yaml(value);
    }
    return node;
}

YAML::Node to_yaml(const StepResult& result)
{
    YAML::Node node;
    node["step_id"] = result.step_id;
    node["status"] = std::string{to_string(result.status)};
    node["started_at"] = optional_timestamp(result.started_at);
    node["completed_at"] = optional_timestamp(result.completed_at);
    node["output"] = to_yaml(result.output);
    node["error"] = result.error;
    node["retry_attempts"] = result.retry_attempts;
    node["duration_ms"] = to_milliseconds(result.duration);
    node["wave"] = result.wave;
    node["sequence"] = result.sequence;
    return node;
}

YAML::Node to_yaml(const Checkpoint& checkpoint)
{
    YAML::Node node;
    node["checkpoint_id"] = checkpoint.checkpoint_id;
    node["created_at"] = format_timestamp(checkpoint.created_at);
    node["wave"] = checkpoint.wave;

    YAML::Node results(YAML::NodeType::Map);
    for (const auto& [id, step_result] : checkpoint.step_results)
    {
        results[id] = to_yaml(step_result);
    }
    node["step_results"] = results;

    node["workflow_state"] = to_yaml(checkpoint.workflow_state);

    YAML::Node owners(YAML::NodeType::Map);
    for (const auto& [key, owner] : checkpoint.state_ownership)
    {
        owners[key] = owner;
    }
    node["state_ownership"] = owners;

    node["completion_order"] = to_yaml_sequence(checkpoint.completion_order);
    node["metadata"] = to_yaml(checkpoint.metadata);
    return node;
}

YAML::Node to_yaml(const ExecutionResult& result)
{
    YAML::Node node;
    node["success"] = result.success;
    node["message"] = result.message;
    node["status"] = std::string{to_string(result.status)};

    YAML::Node results(YAML::NodeType::Map);
    for (const auto& [id, step_result] : result.step_results)
    {
        results[id] = to_yaml(step_result);
    }
    node["step_results"] = results;

    if (result.checkpoint)
    {
        node["checkpoint_id"] = result.checkpoint->checkpoint_id;
    }
    else
    {
        node["checkpoint_id"] = YAML::Node(YAML::NodeType::Null);
    }

    node["started_at"] = optional_timestamp(result.started_at);
    node["completed_at"] = optional_timestamp(result.completed_at);
    node["duration_ms"] = to_milliseconds(result.duration);
    node["errors"] = to_yaml_sequence(result.errors);
    node["completion_order"] = to_yaml_sequence(result.completion_order);
    node["final_state"] = to_yaml(result.final_state);
    return node;
}

std::string dump_yaml(const YAML::Node& node)
{
    YAML::Emitter emitter;
    emitter << node;
    return emitter.c_str();
}

} // namespace wavedag
