#include <gtest/gtest.h>
#include "wavedag/events/event_bus.hpp"

using namespace wavedag;

// =============================================================================
// Test Implementations
// =============================================================================

/**
 * @brief IEventBus whose publish() always throws.
 */
class ThrowingEventBus : public IEventBus
{
public:
    void publish(const WorkflowEvent&) override
    {
        ++m_publish_count;
        throw std::runtime_error("bus unavailable");
    }

    int publish_count() const { return m_publish_count; }

private:
    int m_publish_count{0};
};

// =============================================================================
// Test Fixtures
// =============================================================================

class EventBusTests : public ::testing::Test
{
protected:
    EventBus bus;
    std::vector<std::string> received;

    WorkflowEventHandler recorder(const std::string& tag)
    {
        return [this, tag](const WorkflowEvent& event) {
            received.push_back(tag + ":" + event.step_id);
        };
    }
};

// =============================================================================
// Subscription Tests
// =============================================================================

TEST_F(EventBusTests, Subscribe_ReceivesOnlyMatchingType)
{
    bus.subscribe(WorkflowEventType::StepFailed, recorder("failed"));

    bus.publish(WorkflowEvent::step_started("wf", "a", "A"));
    bus.publish(WorkflowEvent::step_failed("wf", "b", "B", std::chrono::nanoseconds{0}, "boom"));

    EXPECT_EQ(received, (std::vector<std::string>{"failed:b"}));
}

TEST_F(EventBusTests, SubscribePattern_PrefixMatchesStepEvents)
{
    bus.subscribe_pattern("workflow:step:*", recorder("step"));

    bus.publish(WorkflowEvent::step_started("wf", "a", "A"));
    bus.publish(WorkflowEvent::checkpoint_created("wf", "ckpt-1"));
    bus.publish(WorkflowEvent::step_completed("wf", "a", "A", std::chrono::nanoseconds{5}, {}));

    EXPECT_EQ(received, (std::vector<std::string>{"step:a", "step:a"}));
}

TEST_F(EventBusTests, SubscribePattern_ExactKey)
{
    bus.subscribe_pattern("workflow:checkpoint:created", recorder("ckpt"));

    bus.publish(WorkflowEvent::checkpoint_created("wf", "ckpt-1"));
    bus.publish(WorkflowEvent::step_started("wf", "a", "A"));

    EXPECT_EQ(received.size(), 1u);
}

TEST_F(EventBusTests, SubscribeAll_ReceivesEverything)
{
    bus.subscribe_all(recorder("all"));

    bus.publish(WorkflowEvent::rollback_started("reason", ""));
    bus.publish(WorkflowEvent::rollback_completed("reason", "", 2));

    EXPECT_EQ(received.size(), 2u);
}

TEST_F(EventBusTests, Disconnect_StopsDelivery)
{
    auto connection = bus.subscribe_all(recorder("all"));
    bus.publish(WorkflowEvent::step_started("wf", "a", "A"));
    connection.disconnect();
    bus.publish(WorkflowEvent::step_started("wf", "b", "B"));

    EXPECT_EQ(received, (std::vector<std::string>{"all:a"}));
}

TEST_F(EventBusTests, ClearHandlers_DisconnectsEveryone)
{
    bus.subscribe_all(recorder("x"));
    bus.subscribe(WorkflowEventType::StepStarted, recorder("y"));
    EXPECT_EQ(bus.subscriber_count(), 2u);

    bus.clear_handlers();
    bus.publish(WorkflowEvent::step_started("wf", "a", "A"));

    EXPECT_EQ(bus.subscriber_count(), 0u);
    EXPECT_TRUE(received.empty());
}

TEST_F(EventBusTests, ThrowingHandler_DoesNotBlockOthers)
{
    bus.subscribe_all([](const WorkflowEvent&) { throw std::runtime_error("handler bug"); });
    bus.subscribe_all(recorder("ok"));

    EXPECT_NO_THROW(bus.publish(WorkflowEvent::step_started("wf", "a", "A")));
    EXPECT_EQ(received, (std::vector<std::string>{"ok:a"}));
}

TEST_F(EventBusTests, HandlerThrowingNonStdValue_DoesNotBlockOthers)
{
    bus.subscribe_all(recorder("first"));
    bus.subscribe_all([](const WorkflowEvent&) { throw 7; });
    bus.subscribe_all(recorder("last"));
    bus.set_external_publisher([](const WorkflowEvent&) { throw 8; });

    EXPECT_NO_THROW(bus.publish(WorkflowEvent::step_started("wf", "a", "A")));
    EXPECT_EQ(received, (std::vector<std::string>{"first:a", "last:a"}));
}

TEST_F(EventBusTests, ExternalPublisher_ReceivesEveryEvent)
{
    bus.set_external_publisher(recorder("ext"));
    bus.publish(WorkflowEvent::step_started("wf", "a", "A"));

    bus.set_external_publisher([](const WorkflowEvent&) { throw std::runtime_error("offline"); });
    EXPECT_NO_THROW(bus.publish(WorkflowEvent::step_started("wf", "b", "B")));

    EXPECT_EQ(received, (std::vector<std::string>{"ext:a"}));
}

// =============================================================================
// History Tests
// =============================================================================

TEST_F(EventBusTests, History_IsBounded)
{
    EventBus small_bus(3);
    for (int i = 0; i < 5; ++i)
    {
        small_bus.publish(WorkflowEvent::step_started("wf", "s" + std::to_string(i), ""));
    }

    auto history = small_bus.history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history.front().step_id, "s2");
    EXPECT_EQ(history.back().step_id, "s4");
}

TEST_F(EventBusTests, History_FiltersByTypeAndWorkflow)
{
    bus.publish(WorkflowEvent::step_started("orders", "a", ""));
    bus.publish(WorkflowEvent::step_started("billing", "b", ""));
    bus.publish(WorkflowEvent::step_failed("orders", "c", "", std::chrono::nanoseconds{0}, "x"));

    EXPECT_EQ(bus.history(WorkflowEventType::StepStarted).size(), 2u);
    EXPECT_EQ(bus.history(std::nullopt, "orders").size(), 2u);

    auto filtered = bus.history(WorkflowEventType::StepStarted, "orders");
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered.front().step_id, "a");
}

TEST_F(EventBusTests, History_LimitKeepsMostRecent)
{
    for (int i = 0; i < 10; ++i)
    {
        bus.publish(WorkflowEvent::step_started("wf", std::to_string(i), ""));
    }
    auto recent = bus.history(std::nullopt, "", 2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].step_id, "8");
    EXPECT_EQ(recent[1].step_id, "9");
}

TEST_F(EventBusTests, ClearHistory_EmptiesHistory)
{
    bus.publish(WorkflowEvent::step_started("wf", "a", ""));
    bus.clear_history();
    EXPECT_TRUE(bus.history().empty());
}

// =============================================================================
// Helper Tests
// =============================================================================

TEST_F(EventBusTests, MatchesPattern)
{
    EXPECT_TRUE(EventBus::matches_pattern("workflow:step:started", "workflow:*"));
    EXPECT_TRUE(EventBus::matches_pattern("workflow:step:started", "*"));
    EXPECT_TRUE(EventBus::matches_pattern("workflow:step:started", "workflow:step:started"));
    EXPECT_FALSE(EventBus::matches_pattern("workflow:step:started", "workflow:rollback:*"));
    EXPECT_FALSE(EventBus::matches_pattern("workflow", "workflow:step:*"));
}

TEST_F(EventBusTests, PublishQuietly_SwallowsBusFailure)
{
    ThrowingEventBus failing;
    EXPECT_NO_THROW(publish_quietly(&failing, WorkflowEvent::step_started("wf", "a", "")));
    EXPECT_EQ(failing.publish_count(), 1);
    EXPECT_NO_THROW(publish_quietly(nullptr, WorkflowEvent::step_started("wf", "a", "")));
}

TEST_F(EventBusTests, EventKeys)
{
    EXPECT_EQ(WorkflowEvent::step_started("", "", "").key(), "workflow:step:started");
    EXPECT_EQ(WorkflowEvent::checkpoint_created("", "").key(), "workflow:checkpoint:created");
    EXPECT_EQ(WorkflowEvent::rollback_completed("", "", 0).key(), "workflow:rollback:completed");
}
