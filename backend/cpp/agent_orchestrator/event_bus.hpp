#ifndef EVENT_BUS_HPP
#define EVENT_BUS_HPP

#include "agent.hpp"
#include "metrics.hpp"
#include "task.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class EventType {
    TaskSubmitted,
    TaskAssigned,
    TaskStarted,
    TaskCompleted,
    TaskFailed,
    AgentSpawned,
    MetricsUpdated
};

std::string toString(EventType type);

// Throws std::invalid_argument for names that are not published
EventType parseEventType(const std::string& name);

// Snapshot carried by a notification. task is set for task_* events, agents
// holds the assigned agents (task_assigned) or the new agent (agent_spawned),
// metrics is set for metrics_updated.
struct OrchestratorEvent {
    EventType type = EventType::MetricsUpdated;
    std::optional<Task> task;
    std::vector<Agent> agents;
    std::optional<OrchestrationMetrics> metrics;
};

// Components queue events through this while the orchestrator holds its state
// lock; delivery happens after the lock is released.
using EventSink = std::function<void(OrchestratorEvent)>;

// Synchronous in-process publish/subscribe. Handlers run on the publishing
// thread; an exception thrown by one handler is logged and does not reach the
// publisher or the remaining handlers.
class EventBus {
public:
    using Handler = std::function<void(const OrchestratorEvent&)>;
    using Unsubscribe = std::function<void()>;

    EventBus();

    Unsubscribe subscribe(EventType type, Handler handler);
    Unsubscribe subscribe(const std::string& event_name, Handler handler);
    Unsubscribe subscribeAll(Handler handler);

    void publish(const OrchestratorEvent& event) const;

    std::size_t subscriberCount() const;

private:
    struct Subscription {
        std::uint64_t id;
        std::optional<EventType> type; // empty matches every event
        std::shared_ptr<const Handler> handler;
    };

    // Shared with the unsubscribe closures so they stay safe after the bus is gone
    struct Registry {
        std::mutex mutex;
        std::uint64_t next_id = 1;
        std::vector<Subscription> subscriptions;
    };

    Unsubscribe add(std::optional<EventType> type, Handler handler);

    std::shared_ptr<Registry> registry_;
};

#endif // EVENT_BUS_HPP
