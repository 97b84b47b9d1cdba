#include "event_bus.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace {

const EventType kEventTypes[] = {EventType::TaskSubmitted, EventType::TaskAssigned, EventType::TaskStarted,
                                 EventType::TaskCompleted, EventType::TaskFailed,   EventType::AgentSpawned,
                                 EventType::MetricsUpdated};

} // namespace

std::string toString(EventType type) {
    switch (type) {
    case EventType::TaskSubmitted: return "task_submitted";
    case EventType::TaskAssigned: return "task_assigned";
    case EventType::TaskStarted: return "task_started";
    case EventType::TaskCompleted: return "task_completed";
    case EventType::TaskFailed: return "task_failed";
    case EventType::AgentSpawned: return "agent_spawned";
    case EventType::MetricsUpdated: return "metrics_updated";
    }
    throw std::invalid_argument("Unknown event type value");
}

EventType parseEventType(const std::string& name) {
    for (EventType type : kEventTypes) {
        if (toString(type) == name) {
            return type;
        }
    }
    throw std::invalid_argument("Unknown event name: " + name);
}

EventBus::EventBus() : registry_(std::make_shared<Registry>()) {}

EventBus::Unsubscribe EventBus::subscribe(EventType type, Handler handler) {
    return add(type, std::move(handler));
}

EventBus::Unsubscribe EventBus::subscribe(const std::string& event_name, Handler handler) {
    return add(parseEventType(event_name), std::move(handler));
}

EventBus::Unsubscribe EventBus::subscribeAll(Handler handler) {
    return add(std::nullopt, std::move(handler));
}

EventBus::Unsubscribe EventBus::add(std::optional<EventType> type, Handler handler) {
    if (!handler) {
        throw std::invalid_argument("Event handler must not be empty");
    }

    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        id = registry_->next_id++;
        registry_->subscriptions.push_back({id, type, std::make_shared<const Handler>(std::move(handler))});
    }

    std::weak_ptr<Registry> weak_registry = registry_;
    return [weak_registry, id]() {
        auto registry = weak_registry.lock();
        if (!registry) {
            return;
        }
        std::lock_guard<std::mutex> lock(registry->mutex);
        auto& subscriptions = registry->subscriptions;
        subscriptions.erase(std::remove_if(subscriptions.begin(), subscriptions.end(),
                                           [id](const Subscription& s) { return s.id == id; }),
                            subscriptions.end());
    };
}

void EventBus::publish(const OrchestratorEvent& event) const {
    // Copy matching handlers so they can subscribe or unsubscribe while running
    std::vector<std::shared_ptr<const Handler>> handlers;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        for (const auto& subscription : registry_->subscriptions) {
            if (!subscription.type || *subscription.type == event.type) {
                handlers.push_back(subscription.handler);
            }
        }
    }

    for (const auto& handler : handlers) {
        try {
            (*handler)(event);
        } catch (const std::exception& e) {
            std::cerr << "Warning: " << toString(event.type) << " handler failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Warning: " << toString(event.type) << " handler failed with a non-standard exception"
                      << std::endl;
        }
    }
}

std::size_t EventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->subscriptions.size();
}
