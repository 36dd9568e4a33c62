#include "engine/core/EventBus.hpp"

#include <sstream>

namespace engine::core
{
std::string Event::ToString() const
{
    std::ostringstream oss;
    oss << "#" << frame << " " << name;
    for (const std::string& arg : args)
    {
        oss << " " << arg;
    }
    return oss.str();
}

EventBus::EventBus(std::size_t historyLimit)
    : m_historyLimit(historyLimit)
{
}

void EventBus::Subscribe(const std::string& eventName, Handler handler)
{
    m_handlers[eventName].push_back(std::move(handler));
}

void EventBus::Publish(Event event)
{
    m_queue.push(std::move(event));
}

std::size_t EventBus::DispatchQueued()
{
    std::size_t delivered = 0;
    while (!m_queue.empty())
    {
        Event event = std::move(m_queue.front());
        m_queue.pop();

        const auto it = m_handlers.find(event.name);
        if (it != m_handlers.end())
        {
            Deliver(it->second, event);
        }
        const auto any = m_handlers.find(kAnyEvent);
        if (any != m_handlers.end())
        {
            Deliver(any->second, event);
        }

        if (m_historyLimit > 0)
        {
            m_history.push_back(std::move(event));
            while (m_history.size() > m_historyLimit)
            {
                m_history.pop_front();
            }
        }
        ++delivered;
    }
    return delivered;
}

void EventBus::ClearQueue()
{
    std::queue<Event> empty;
    m_queue.swap(empty);
}

void EventBus::Deliver(const std::vector<Handler>& handlers, const Event& event) const
{
    for (const Handler& handler : handlers)
    {
        handler(event);
    }
}
} // namespace engine::core
