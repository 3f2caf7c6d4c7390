#include "wavedag/events/event_bus.hpp"
#include <spdlog/spdlog.h>

namespace wavedag
{

EventBus::EventBus(size_t max_history)
    : m_max_history{max_history}
{}

void EventBus::publish(const WorkflowEvent& event)
{
    WorkflowEventHandler external;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_max_history > 0)
        {
            m_history.push_back(event);
            while (m_history.size() > m_max_history)
            {
                m_history.pop_front();
            }
        }
        external = m_external_publisher;
    }

    // boost::signals2 is thread-safe for emission
    m_signal(event);

    if (external)
    {
        try
        {
            external(event);
        }
        catch (const std::exception& e)
        {
            SPDLOG_ERROR("External publisher error for {}: {}", event.key(), e.what());
        }
        catch (...)
        {
            SPDLOG_ERROR("External publisher error for {}: unknown exception", event.key());
        }
    }

    SPDLOG_DEBUG("Published workflow event: {}", event.key());
}

boost::signals2::connection EventBus::subscribe(WorkflowEventType type, WorkflowEventHandler handler)
{
    return connect_guarded(
        to_string(type),
        [type](const WorkflowEvent& event) { return event.type == type; },
        std::move(handler));
}

boost::signals2::connection EventBus::subscribe_pattern(std::string pattern, WorkflowEventHandler handler)
{
    std::string description = "pattern " + pattern;
    return connect_guarded(
        std::move(description),
        [pattern = std::move(pattern)](const WorkflowEvent& event) {
            return matches_pattern(event.key(), pattern);
        },
        std::move(handler));
}

boost::signals2::connection EventBus::subscribe_all(WorkflowEventHandler handler)
{
    return connect_guarded(
        "all events",
        [](const WorkflowEvent&) { return true; },
        std::move(handler));
}

void EventBus::set_external_publisher(WorkflowEventHandler publisher)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_external_publisher = std::move(publisher);
}

std::vector<WorkflowEvent> EventBus::history(std::optional<WorkflowEventType> type,
                                             const std::string& workflow_type,
                                             size_t limit) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<WorkflowEvent> matches;
    for (const auto& event : m_history)
    {
        if (type && event.type != *type)
        {
            continue;
        }
        if (!workflow_type.empty() && event.workflow_type != workflow_type)
        {
            continue;
        }
        matches.push_back(event);
    }

    if (matches.size() > limit)
    {
        matches.erase(matches.begin(), matches.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return matches;
}

void EventBus::clear_history()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.clear();
}

void EventBus::clear_handlers()
{
    m_signal.disconnect_all_slots();
}

size_t EventBus::subscriber_count() const
{
    return m_signal.num_slots();
}

bool EventBus::matches_pattern(const std::string& key, const std::string& pattern)
{
    if (!pattern.empty() && pattern.back() == '*')
    {
        return key.compare(0, pattern.size() - 1, pattern, 0, pattern.size() - 1) == 0;
    }
    return key == pattern;
}

boost::signals2::connection EventBus::connect_guarded(std::string description,
                                                      std::function<bool(const WorkflowEvent&)> accepts,
                                                      WorkflowEventHandler handler)
{
    // A throwing slot would abort signal emission for the remaining slots,
    // so every handler is isolated here.
    auto guarded = [description = std::move(description),
                    accepts = std::move(accepts),
                    handler = std::move(handler)](const WorkflowEvent& event) {
        if (!accepts(event))
        {
            return;
        }
        try
        {
            handler(event);
        }
        catch (const std::exception& e)
        {
            SPDLOG_ERROR("Handler error for {} ({}): {}", event.key(), description, e.what());
        }
        catch (...)
        {
            SPDLOG_ERROR("Handler error for {} ({}): unknown exception", event.key(), description);
        }
    };

    // boost::signals2 is thread-safe for connection
    return m_signal.connect(std::move(guarded));
}

void publish_quietly(IEventBus* bus, const WorkflowEvent& event) noexcept
{
    if (!bus)
    {
        return;
    }
    try
    {
        bus->publish(event);
    }
    catch (const std::exception& e)
    {
        SPDLOG_ERROR("Failed to publish {}: {}", event.key(), e.what());
    }
    catch (...)
    {
        SPDLOG_ERROR("Failed to publish {}: unknown exception", event.key());
    }
}

} // namespace wavedag
