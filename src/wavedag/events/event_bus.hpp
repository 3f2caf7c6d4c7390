/**
 * @file event_bus.hpp
 * @brief In-process publish/subscribe event bus built on boost::signals2.
 */
#pragma once
#include "wavedag/events/workflow_events.hpp"
#include <boost/signals2/signal.hpp>
#include <deque>

namespace wavedag
{

using WorkflowEventSignal = boost::signals2::signal<void(const WorkflowEvent&)>;
using WorkflowEventHandler = std::function<void(const WorkflowEvent&)>;

/**
 * @brief Thread-safe event bus with typed, pattern and catch-all subscribers.
 *
 * @details
 * Each publish():
 * 1. Appends the event to a bounded history (oldest entries are dropped).
 * 2. Invokes every connected handler whose subscription matches.
 * 3. Forwards the event to the external publisher, if one is set.
 *
 * A handler that throws is logged and does not prevent the other handlers
 * (or the external publisher) from receiving the event.
 *
 * Pattern subscriptions match on WorkflowEvent::key(): a pattern ending in
 * '*' matches every key with that prefix ("workflow:step:*"); any other
 * pattern must equal the key.
 *
 * @par Thread Safety
 * - All methods may be called from any thread.
 * - Handlers run synchronously on the publishing thread.
 */
class EventBus : public IEventBus
{
public:
    static constexpr size_t kDefaultMaxHistory = 500;

    explicit EventBus(size_t max_history = kDefaultMaxHistory);
    ~EventBus() override = default;

    // Non-copyable
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void publish(const WorkflowEvent& event) override;

    /**
     * @brief Receive only events of one type.
     * @return Connection that can be used to disconnect.
     */
    boost::signals2::connection subscribe(WorkflowEventType type, WorkflowEventHandler handler);

    /**
     * @brief Receive events whose key matches a pattern.
     */
    boost::signals2::connection subscribe_pattern(std::string pattern, WorkflowEventHandler handler);

    /**
     * @brief Receive every event.
     */
    boost::signals2::connection subscribe_all(WorkflowEventHandler handler);

    /**
     * @brief Forward every published event to a system outside the process.
     * @param publisher Replaces any previous publisher; empty function clears it.
     */
    void set_external_publisher(WorkflowEventHandler publisher);

    /**
     * @brief Recent events, oldest first.
     * @param type Only events of this type, if given.
     * @param workflow_type Only events of this workflow type, if non-empty.
     * @param limit Return at most this many of the most recent matches.
     */
    std::vector<WorkflowEvent> history(std::optional<WorkflowEventType> type = std::nullopt,
                                       const std::string& workflow_type = "",
                                       size_t limit = 100) const;

    void clear_history();

    /**
     * @brief Disconnect every subscriber.
     */
    void clear_handlers();

    size_t subscriber_count() const;

    static bool matches_pattern(const std::string& key, const std::string& pattern);

private:
    boost::signals2::connection connect_guarded(std::string description,
                                                std::function<bool(const WorkflowEvent&)> accepts,
                                                WorkflowEventHandler handler);

    WorkflowEventSignal m_signal;

    mutable std::mutex m_mutex;
    std::deque<WorkflowEvent> m_history;
    size_t m_max_history;
    WorkflowEventHandler m_external_publisher;
};

/**
 * @brief Event bus that discards everything.
 */
class NullEventBus : public IEventBus
{
public:
    void publish(const WorkflowEvent&) override
    {
        // No-op
    }
};

inline std::shared_ptr<EventBus> make_event_bus(size_t max_history = EventBus::kDefaultMaxHistory)
{
    return std::make_shared<EventBus>(max_history);
}

inline EventBusPtr make_null_event_bus()
{
    return std::make_shared<NullEventBus>();
}

/**
 * @brief Publish without letting a bus failure reach the caller.
 * @details Exceptions escaping `bus.publish()` are logged. A null bus is
 *          a no-op.
 */
void publish_quietly(IEventBus* bus, const WorkflowEvent& event) noexcept;

} // namespace wavedag
