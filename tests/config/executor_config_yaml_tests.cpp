#include <gtest/gtest.h>
#include "wavedag/common/workflow_exceptions.hpp"
#include "wavedag/config/executor_config_yaml.hpp"
#include <cstdio>
#include <fstream>

using namespace wavedag;

class ExecutorConfigYamlTests : public ::testing::Test
{
protected:
    static WorkflowErrorCode error_code_of(const std::string& yaml_text)
    {
        try
        {
            (void)parse_executor_config(yaml_text);
        }
        catch (const WorkflowError& e)
        {
            return e.code();
        }
        ADD_FAILURE() << "Expected WorkflowError for: " << yaml_text;
        return WorkflowErrorCode::InvalidWorkflow;
    }
};

TEST_F(ExecutorConfigYamlTests, Parse_AllKeys)
{
    auto config = parse_executor_config(
        "max_workers: 8\n"
        "auto_checkpoint: false\n"
        "stop_on_failure: false\n"
        "validate_workflow: false\n"
        "timeout_policy: fail_attempt\n"
        "event_history_limit: 50\n"
        "log_level: debug\n");

    EXPECT_EQ(config.max_workers, 8u);
    EXPECT_FALSE(config.auto_checkpoint);
    EXPECT_FALSE(config.stop_on_failure);
    EXPECT_FALSE(config.validate_workflow);
    EXPECT_EQ(config.timeout_policy, TimeoutPolicy::FailAttempt);
    EXPECT_EQ(config.event_history_limit, 50u);
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ExecutorConfigYamlTests, Parse_MissingKeys_KeepDefaults)
{
    auto config = parse_executor_config("max_workers: 2\n");
    ExecutorConfig defaults;

    EXPECT_EQ(config.max_workers, 2u);
    EXPECT_EQ(config.auto_checkpoint, defaults.auto_checkpoint);
    EXPECT_EQ(config.stop_on_failure, defaults.stop_on_failure);
    EXPECT_EQ(config.timeout_policy, TimeoutPolicy::Ignore);
    EXPECT_EQ(config.event_history_limit, 500u);
    EXPECT_EQ(config.log_level, "info");
}

TEST_F(ExecutorConfigYamlTests, Parse_EmptyDocument_IsDefault)
{
    auto config = parse_executor_config("");
    EXPECT_EQ(config.max_workers, 4u);
}

TEST_F(ExecutorConfigYamlTests, Parse_ZeroWorkers_Allowed)
{
    EXPECT_EQ(parse_executor_config("max_workers: 0").max_workers, 0u);
}

TEST_F(ExecutorConfigYamlTests, Parse_InvalidValues_ThrowInvalidConfig)
{
    EXPECT_EQ(error_code_of("max_workers: -1"), WorkflowErrorCode::InvalidConfig);
    EXPECT_EQ(error_code_of("timeout_policy: kill"), WorkflowErrorCode::InvalidConfig);
    EXPECT_EQ(error_code_of("log_level: loud"), WorkflowErrorCode::InvalidConfig);
    EXPECT_EQ(error_code_of("auto_checkpoint: maybe"), WorkflowErrorCode::InvalidConfig);
    EXPECT_EQ(error_code_of("- not\n- a map\n"), WorkflowErrorCode::InvalidConfig);
    EXPECT_EQ(error_code_of("max_workers: [1"), WorkflowErrorCode::InvalidConfig);
}

TEST_F(ExecutorConfigYamlTests, Encode_DecodesToSameConfig)
{
    ExecutorConfig original;
    original.max_workers = 3;
    original.stop_on_failure = false;
    original.timeout_policy = TimeoutPolicy::FailAttempt;
    original.log_level = "warn";

    YAML::Node node = YAML::convert<ExecutorConfig>::encode(original);
    EXPECT_EQ(node["timeout_policy"].as<std::string>(), "fail_attempt");

    auto decoded = node.as<ExecutorConfig>();
    EXPECT_EQ(decoded.max_workers, 3u);
    EXPECT_FALSE(decoded.stop_on_failure);
    EXPECT_EQ(decoded.timeout_policy, TimeoutPolicy::FailAttempt);
    EXPECT_EQ(decoded.log_level, "warn");
}

TEST_F(ExecutorConfigYamlTests, LoadFile_ReadsConfig)
{
    std::string path = ::testing::TempDir() + "wavedag_config_test.yaml";
    {
        std::ofstream out(path);
        out << "max_workers: 6\ntimeout_policy: ignore\n";
    }

    auto config = load_executor_config(path);
    std::remove(path.c_str());

    EXPECT_EQ(config.max_workers, 6u);
    EXPECT_EQ(config.timeout_policy, TimeoutPolicy::Ignore);
}

TEST_F(ExecutorConfigYamlTests, LoadFile_Missing_ThrowsInvalidConfig)
{
    try
    {
        (void)load_executor_config(::testing::TempDir() + "does_not_exist_wavedag.yaml");
        FAIL() << "Expected WorkflowError";
    }
    catch (const WorkflowError& e)
    {
        EXPECT_EQ(e.code(), WorkflowErrorCode::InvalidConfig);
    }
}

TEST_F(ExecutorConfigYamlTests, ParseTimeoutPolicy)
{
    EXPECT_EQ(parse_timeout_policy("ignore"), TimeoutPolicy::Ignore);
    EXPECT_EQ(parse_timeout_policy("fail_attempt"), TimeoutPolicy::FailAttempt);
    EXPECT_THROW(parse_timeout_policy("Ignore"), WorkflowError);
}
