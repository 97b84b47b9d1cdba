#ifndef EXECUTION_ENGINE_HPP
#define EXECUTION_ENGINE_HPP

#include "agent_pool.hpp"
#include "clock.hpp"
#include "dispatcher.hpp"
#include "event_bus.hpp"
#include "learning_controller.hpp"
#include "orchestrator_config.hpp"
#include "task_registry.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

// Runs assigned tasks through the dispatcher and applies their outcomes.
// execute() and applyOutcome() mutate shared state and must be called with the
// orchestrator's state lock held. Waiting for a dispatch happens on a separate
// thread per execution, which reports back through the completion handler.
class ExecutionEngine {
public:
    using CompletionHandler = std::function<void(const std::string& task_id, const DispatchResult& result)>;

    ExecutionEngine(AgentPool& pool, TaskRegistry& registry, LearningController& learning,
                    std::shared_ptr<Dispatcher> dispatcher, std::shared_ptr<const Clock> clock, EventSink emit,
                    const OrchestratorConfig& config);

    void setCompletionHandler(CompletionHandler handler) { on_finished_ = std::move(handler); }

    // assigned -> processing, then dispatch without blocking
    void execute(const std::string& task_id);

    // processing -> completed or failed; failed critical tasks go back to the
    // front of the queue while retries remain
    void applyOutcome(const std::string& task_id, const DispatchResult& result);

    std::size_t inFlight() const { return in_flight_; }

    // Hands over the waiter threads so they can be joined without the state lock
    std::vector<std::future<void>> takeWaiters();

    // Watchdog budget for one execution; zero when the watchdog is disabled
    std::chrono::milliseconds timeoutFor(const Task& task) const;

private:
    void await(const std::string& task_id, std::future<DispatchResult> pending, std::chrono::milliseconds timeout);
    void pruneWaiters();

    AgentPool& pool_;
    TaskRegistry& registry_;
    LearningController& learning_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::shared_ptr<const Clock> clock_;
    EventSink emit_;
    const OrchestratorConfig& config_;
    CompletionHandler on_finished_;
    std::size_t in_flight_ = 0;
    std::vector<std::future<void>> waiters_;
};

#endif // EXECUTION_ENGINE_HPP
