#include <gtest/gtest.h>
#include "wavedag/common/value.inline.hpp"
#include "wavedag/common/workflow_exceptions.hpp"
#include "wavedag/execution/checkpoint_store.hpp"
#include <regex>

using namespace wavedag;

class CheckpointStoreTests : public ::testing::Test
{
protected:
    CheckpointStore store;

    static Checkpoint make_snapshot(size_t wave)
    {
        Checkpoint snapshot;
        snapshot.wave = wave;
        StepResult done;
        done.step_id = "a";
        done.status = StepStatus::Completed;
        done.sequence = 1;
        snapshot.step_results["a"] = done;
        snapshot.workflow_state = {{"k", 1}};
        snapshot.completion_order = {"a"};
        return snapshot;
    }
};

TEST_F(CheckpointStoreTests, Create_AssignsIdAndTimestamp)
{
    auto before = WallClock::now();
    auto checkpoint = store.create(make_snapshot(1));

    ASSERT_NE(checkpoint, nullptr);
    EXPECT_TRUE(std::regex_match(checkpoint->checkpoint_id, std::regex{"ckpt-1-[0-9a-f]{16}"}));
    EXPECT_GE(checkpoint->created_at, before);
    EXPECT_EQ(checkpoint->wave, 1u);
}

TEST_F(CheckpointStoreTests, Create_IdsAreUnique)
{
    auto first = store.create(make_snapshot(1));
    auto second = store.create(make_snapshot(2));
    EXPECT_NE(first->checkpoint_id, second->checkpoint_id);
}

TEST_F(CheckpointStoreTests, Get_ReturnsRegistered)
{
    auto checkpoint = store.create(make_snapshot(1));
    EXPECT_EQ(store.get(checkpoint->checkpoint_id), checkpoint);
}

TEST_F(CheckpointStoreTests, Get_Unknown_ReturnsNull)
{
    EXPECT_EQ(store.get("ckpt-404"), nullptr);
}

TEST_F(CheckpointStoreTests, Require_Unknown_Throws)
{
    try
    {
        (void)store.require("ckpt-404");
        FAIL() << "Expected WorkflowError";
    }
    catch (const WorkflowError& e)
    {
        EXPECT_EQ(e.code(), WorkflowErrorCode::CheckpointNotFound);
        EXPECT_EQ(std::string{e.what()}, "Checkpoint not found: ckpt-404");
    }
}

TEST_F(CheckpointStoreTests, Snapshot_IsIndependentOfSource)
{
    Checkpoint snapshot = make_snapshot(1);
    auto checkpoint = store.create(snapshot);

    snapshot.workflow_state["k"] = 2;
    snapshot.step_results["a"].status = StepStatus::Failed;

    EXPECT_EQ(checkpoint->workflow_state.at("k").as<std::int64_t>(), 1);
    EXPECT_EQ(checkpoint->step_results.at("a").status, StepStatus::Completed);
}

TEST_F(CheckpointStoreTests, List_IsInCreationOrder)
{
    auto first = store.create(make_snapshot(1));
    auto second = store.create(make_snapshot(2));
    auto third = store.create(make_snapshot(3));

    auto listed = store.list();
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed[0], first);
    EXPECT_EQ(listed[1], second);
    EXPECT_EQ(listed[2], third);
}

TEST_F(CheckpointStoreTests, Clear_RemovesAll_KeepsHandedOutPointersAlive)
{
    auto checkpoint = store.create(make_snapshot(1));
    store.clear();

    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.get(checkpoint->checkpoint_id), nullptr);
    EXPECT_EQ(checkpoint->wave, 1u);
}

TEST_F(CheckpointStoreTests, CompletedSteps_ListsOnlyCompleted)
{
    Checkpoint snapshot = make_snapshot(1);
    snapshot.step_results["b"] = StepResult::skipped("b", "Dependencies not met");
    auto completed = snapshot.completed_steps();
    EXPECT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed.count("a"), 1u);
}
