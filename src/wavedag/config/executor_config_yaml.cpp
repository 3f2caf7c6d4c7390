#include "wavedag/config/executor_config_yaml.hpp"
#include "wavedag/common/workflow_exceptions.hpp"

namespace wavedag
{

namespace
{

[[noreturn]] void invalid_config(const std::string& message)
{
    throw WorkflowError(WorkflowErrorCode::InvalidConfig, message);
}

size_t read_count(const YAML::Node& node, const char* key, size_t fallback)
{
    if (!node[key])
    {
        return fallback;
    }
    auto value = node[key].as<long long>();
    if (value < 0)
    {
        invalid_config(std::string{key} + " must not be negative, got " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

bool read_flag(const YAML::Node& node, const char* key, bool fallback)
{
    return node[key] ? node[key].as<bool>() : fallback;
}

const std::vector<std::string>& known_log_levels()
{
    static const std::vector<std::string> levels{
        "trace", "debug", "info", "warning", "warn", "error", "critical", "off"};
    return levels;
}

} // namespace

TimeoutPolicy parse_timeout_policy(const std::string& name)
{
    if (name == "ignore")
    {
        return TimeoutPolicy::Ignore;
    }
    if (name == "fail_attempt")
    {
        return TimeoutPolicy::FailAttempt;
    }
    invalid_config("Unknown timeout_policy '" + name + "' (expected ignore or fail_attempt)");
}

ExecutorConfig parse_executor_config(const std::string& yaml_text)
{
    try
    {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull())
        {
            return ExecutorConfig{};
        }
        return root.as<ExecutorConfig>();
    }
    catch (const YAML::Exception& e)
    {
        invalid_config(std::string{"Invalid executor config: "} + e.what());
    }
}

ExecutorConfig load_executor_config(const std::string& path)
{
    try
    {
        YAML::Node root = YAML::LoadFile(path);
        if (!root || root.IsNull())
        {
            return ExecutorConfig{};
        }
        return root.as<ExecutorConfig>();
    }
    catch (const YAML::Exception& e)
    {
        invalid_config("Invalid executor config '" + path + "': " + e.what());
    }
}

} // namespace wavedag

namespace YAML
{

Node convert<wavedag::ExecutorConfig>::encode(const wavedag::ExecutorConfig& rhs)
{
    Node node;
    node["max_workers"] = rhs.max_workers;
    node["auto_checkpoint"] = rhs.auto_checkpoint;
    node["stop_on_failure"] = rhs.stop_on_failure;
    node["validate_workflow"] = rhs.validate_workflow;
    node["timeout_policy"] = std::string{wavedag::to_string(rhs.timeout_policy)};
    node["event_history_limit"] = rhs.event_history_limit;
    node["log_level"] = rhs.log_level;
    return node;
}

bool convert<wavedag::ExecutorConfig>::decode(const Node& node, wavedag::ExecutorConfig& rhs)
{
    if (!node.IsMap())
    {
        return false;
    }

    wavedag::ExecutorConfig config;
    config.max_workers = wavedag::read_count(node, "max_workers", config.max_workers);
    config.auto_checkpoint = wavedag::read_flag(node, "auto_checkpoint", config.auto_checkpoint);
    config.stop_on_failure = wavedag::read_flag(node, "stop_on_failure", config.stop_on_failure);
    config.validate_workflow = wavedag::read_flag(node, "validate_workflow", config.validate_workflow);
    config.event_history_limit =
        wavedag::read_count(node, "event_history_limit", config.event_history_limit);

    if (node["timeout_policy"])
    {
        config.timeout_policy = wavedag::parse_timeout_policy(node["timeout_policy"].as<std::string>());
    }

    if (node["log_level"])
    {
        auto level = node["log_level"].as<std::string>();
        const auto& levels = wavedag::known_log_levels();
        if (std::find(levels.begin(), levels.end(), level) == levels.end())
        {
            wavedag::invalid_config("Unknown log_level '" + level + "'");
        }
        config.log_level = level;
    }

    rhs = std::move(config);
    return true;
}

} // namespace YAML
