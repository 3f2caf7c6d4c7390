#include <gtest/gtest.h>
#include "wavedag/common/workflow_exceptions.hpp"
#include "wavedag/events/event_bus.hpp"
#include "wavedag/execution/executor.hpp"
#include "wavedag/execution/rollback_coordinator.hpp"

using namespace wavedag;

// =============================================================================
// Test Implementations
// =============================================================================

/**
 * @brief IRollbackAction that records the params it was undone with.
 */
class RecordingRollback : public IRollbackAction
{
public:
    RecordingRollback(std::string id, std::shared_ptr<std::vector<std::string>> order)
        : m_id{std::move(id)}
        , m_order{std::move(order)}
    {}

    void rollback(const ValueMap& params) override
    {
        m_order->push_back(m_id);
        m_last_params = params;
        if (m_should_throw)
        {
            throw std::runtime_error("cannot undo " + m_id);
        }
    }

    void set_should_throw(bool value) { m_should_throw = value; }
    const ValueMap& last_params() const { return m_last_params; }

private:
    std::string m_id;
    std::shared_ptr<std::vector<std::string>> m_order;
    ValueMap m_last_params;
    bool m_should_throw{false};
};

// =============================================================================
// Test Fixtures
// =============================================================================

class RollbackTests : public ::testing::Test
{
protected:
    std::shared_ptr<EventBus> bus = make_event_bus();
    std::shared_ptr<std::vector<std::string>> undo_order = std::make_shared<std::vector<std::string>>();
    std::map<std::string, std::shared_ptr<RecordingRollback>> rollbacks;

    StepDefinition make_step(const std::string& id, std::vector<StepId> deps = {}, bool with_rollback = true)
    {
        StepDefinition step;
        step.step_id = id;
        step.name = id;
        step.dependencies = std::move(deps);
        step.params = {{"id", id}};
        step.action = make_step_action([id](const ValueMap&, StepStateView&) {
            return ValueMap{{"done", id}};
        });
        if (with_rollback)
        {
            auto rollback = std::make_shared<RecordingRollback>(id, undo_order);
            rollbacks[id] = rollback;
            step.rollback = rollback;
        }
        return step;
    }

    static StepResult completed(const std::string& id, size_t sequence)
    {
        StepResult result;
        result.step_id = id;
        result.status = StepStatus::Completed;
        result.sequence = sequence;
        return result;
    }
};

// =============================================================================
// Full Rollback
// =============================================================================

TEST_F(RollbackTests, Rollback_NoCheckpoint_RevertsEveryCompletedStepOnce)
{
    WorkflowExecutor executor({}, bus);
    std::vector<StepDefinition> steps{make_step("a"), make_step("b", {"a"}), make_step("c", {"b"})};
    auto run = executor.execute(steps);
    ASSERT_TRUE(run.success);

    auto result = executor.rollback(steps, run.step_results, "undo all");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::RolledBack);
    EXPECT_EQ(result.message, "Rolled back 3 step(s)");
    EXPECT_EQ(*undo_order, (std::vector<std::string>{"c", "b", "a"}));
    for (const auto& id : {"a", "b", "c"})
    {
        EXPECT_EQ(run.step_results.at(id).status, StepStatus::RolledBack);
        EXPECT_EQ(result.step_results.at(id).status, StepStatus::RolledBack);
    }
}

TEST_F(RollbackTests, Rollback_ReceivesOnlyParams)
{
    WorkflowExecutor executor({}, bus);
    std::vector<StepDefinition> steps{make_step("a")};
    auto run = executor.execute(steps);

    (void)executor.rollback(steps, run.step_results);

    EXPECT_EQ(rollbacks["a"]->last_params(), (ValueMap{{"id", "a"}}));
}

TEST_F(RollbackTests, Rollback_StepWithoutAction_StaysCompleted)
{
    WorkflowExecutor executor({}, bus);
    std::vector<StepDefinition> steps{make_step("a"), make_step("plain", {}, false)};
    auto run = executor.execute(steps);

    auto result = executor.rollback(steps, run.step_results);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "Rolled back 1 step(s)");
    EXPECT_EQ(run.step_results.at("plain").status, StepStatus::Completed);
    EXPECT_EQ(run.step_results.at("a").status, StepStatus::RolledBack);
}

TEST_F(RollbackTests, Rollback_FailureIsCollectedAndOthersContinue)
{
    WorkflowExecutor executor({}, bus);
    std::vector<StepDefinition> steps{make_step("a"), make_step("b", {"a"}), make_step("c", {"b"})};
    auto run = executor.execute(steps);
    rollbacks["b"]->set_should_throw(true);

    auto result = executor.rollback(steps, run.step_results, "partial");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::RolledBack);
    EXPECT_EQ(result.errors, (std::vector<std::string>{"Rollback failed for b: cannot undo b"}));
    EXPECT_EQ(*undo_order, (std::vector<std::string>{"c", "b", "a"}));
    EXPECT_EQ(run.step_results.at("b").status, StepStatus::Completed);
    EXPECT_EQ(run.step_results.at("a").status, StepStatus::RolledBack);
    EXPECT_EQ(result.message, "Rolled back 2 step(s)");
}

TEST_F(RollbackTests, Rollback_IgnoresFailedAndSkippedSteps)
{
    ExecutorConfig config;
    config.stop_on_failure = false;
    WorkflowExecutor executor(config, bus);

    auto bad = make_step("bad");
    bad.action = make_step_action([](const ValueMap&, StepStateView&) -> ValueMap {
        throw std::runtime_error("no");
    });
    std::vector<StepDefinition> steps{make_step("ok"), bad, make_step("child", {"bad"})};
    auto run = executor.execute(steps);

    (void)executor.rollback(steps, run.step_results);

    EXPECT_EQ(*undo_order, (std::vector<std::string>{"ok"}));
    EXPECT_EQ(run.step_results.at("bad").status, StepStatus::Failed);
    EXPECT_EQ(run.step_results.at("child").status, StepStatus::Skipped);
}

// =============================================================================
// Rollback to Checkpoint
// =============================================================================

TEST_F(RollbackTests, Rollback_ToCheckpoint_RevertsOnlyLaterSteps)
{
    WorkflowExecutor executor({}, bus);
    std::vector<StepDefinition> steps{make_step("A"), make_step("B"), make_step("C", {"A", "B"})};
    auto run = executor.execute(steps);
    ASSERT_TRUE(run.success);

    auto after_first_wave = executor.list_checkpoints().front();
    ASSERT_EQ(after_first_wave->completed_steps(), (std::unordered_set<StepId>{"A", "B"}));

    auto result = executor.rollback(steps, run.step_results, "undo C", after_first_wave->checkpoint_id);

    EXPECT_EQ(*undo_order, (std::vector<std::string>{"C"}));
    EXPECT_EQ(run.step_results.at("C").status, StepStatus::RolledBack);
    EXPECT_EQ(run.step_results.at("A").status, StepStatus::Completed);
    EXPECT_EQ(run.step_results.at("B").status, StepStatus::Completed);
    EXPECT_EQ(result.message, "Rolled back 1 step(s)");
}

TEST_F(RollbackTests, Rollback_ToLatestCheckpoint_RevertsNothing)
{
    WorkflowExecutor executor({}, bus);
    std::vector<StepDefinition> steps{make_step("A"), make_step("B", {"A"})};
    auto run = executor.execute(steps);

    auto result = executor.rollback(steps, run.step_results, "", run.checkpoint->checkpoint_id);

    EXPECT_TRUE(undo_order->empty());
    EXPECT_EQ(result.message, "Rolled back 0 step(s)");
}

TEST_F(RollbackTests, Rollback_UnknownCheckpoint_Throws)
{
    WorkflowExecutor executor({}, bus);
    std::vector<StepDefinition> steps{make_step("A")};
    auto run = executor.execute(steps);

    try
    {
        (void)executor.rollback(steps, run.step_results, "", std::string{"ckpt-nope"});
        FAIL() << "Expected WorkflowError";
    }
    catch (const WorkflowError& e)
    {
        EXPECT_EQ(e.code(), WorkflowErrorCode::CheckpointNotFound);
    }
    EXPECT_TRUE(undo_order->empty());
    EXPECT_EQ(run.step_results.at("A").status, StepStatus::Completed);
}

// =============================================================================
// Events
// =============================================================================

TEST_F(RollbackTests, Rollback_PublishesStartedAndCompleted)
{
    WorkflowExecutor executor({}, bus);
    std::vector<StepDefinition> steps{make_step("A")};
    auto run = executor.execute(steps);

    (void)executor.rollback(steps, run.step_results, "operator request");

    auto started = bus->history(WorkflowEventType::RollbackStarted);
    auto completed_events = bus->history(WorkflowEventType::RollbackCompleted);
    ASSERT_EQ(started.size(), 1u);
    ASSERT_EQ(completed_events.size(), 1u);
    EXPECT_EQ(started[0].rollback_reason, "operator request");
    EXPECT_EQ(completed_events[0].steps_rolled_back, 1u);
}

// =============================================================================
// Ordering
// =============================================================================

TEST_F(RollbackTests, RollbackOrder_DescendingSequenceThenReverseSubmission)
{
    std::vector<StepDefinition> steps{make_step("a"), make_step("b"), make_step("c"), make_step("d")};
    StepResultMap results{
        {"a", completed("a", 2)},
        {"b", completed("b", 0)},
        {"c", completed("c", 1)},
        {"d", completed("d", 0)},
    };

    auto order = RollbackCoordinator::rollback_order(steps, results, nullptr);

    EXPECT_EQ(order, (std::vector<StepId>{"a", "c", "d", "b"}));
}

TEST_F(RollbackTests, Coordinator_DirectUse_UpdatesResultsInPlace)
{
    std::vector<StepDefinition> steps{make_step("a"), make_step("b")};
    StepResultMap results{{"a", completed("a", 1)}, {"b", completed("b", 2)}};

    RollbackCoordinator coordinator(bus);
    auto result = coordinator.rollback(steps, results, "direct", nullptr);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(*undo_order, (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(results.at("a").status, StepStatus::RolledBack);
}
