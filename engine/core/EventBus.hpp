#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace engine::core
{
struct Event
{
    std::string name;
    std::vector<std::string> args;
    std::uint64_t frame = 0;

    [[nodiscard]] std::string ToString() const;
};

/// Queued publish/subscribe. Handlers run only from DispatchQueued, on the caller's thread.
class EventBus
{
public:
    using Handler = std::function<void(const Event&)>;

    static constexpr const char* kAnyEvent = "*";

    explicit EventBus(std::size_t historyLimit = 128);

    /// Subscribing to kAnyEvent receives every event.
    void Subscribe(const std::string& eventName, Handler handler);
    void Publish(Event event);
    /// Returns the number of events delivered.
    std::size_t DispatchQueued();
    void ClearQueue();

    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }
    [[nodiscard]] const std::deque<Event>& History() const { return m_history; }
    [[nodiscard]] std::size_t HistoryLimit() const { return m_historyLimit; }

private:
    void Deliver(const std::vector<Handler>& handlers, const Event& event) const;

    std::unordered_map<std::string, std::vector<Handler>> m_handlers;
    std::queue<Event> m_queue;
    std::deque<Event> m_history;
    std::size_t m_historyLimit;
};
} // namespace engine::core
