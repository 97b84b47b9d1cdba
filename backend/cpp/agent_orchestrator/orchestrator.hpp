#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP

#include "agent_pool.hpp"
#include "clock.hpp"
#include "dispatcher.hpp"
#include "event_bus.hpp"
#include "execution_engine.hpp"
#include "learning_controller.hpp"
#include "metrics.hpp"
#include "orchestrator_config.hpp"
#include "random_source.hpp"
#include "scheduler.hpp"
#include "task_registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class Orchestrator {
public:
    // Null collaborators fall back to the system clock, a Mersenne source seeded
    // from config.rng_seed, and the simulated dispatcher.
    explicit Orchestrator(OrchestratorConfig config = OrchestratorConfig(),
                          std::shared_ptr<Dispatcher> dispatcher = nullptr,
                          std::shared_ptr<const Clock> clock = nullptr,
                          std::shared_ptr<RandomSource> random = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Start or stop the periodic tick. stop() also waits for in-flight executions.
    void start();
    void stop();

    std::string submitTask(TaskSpec spec);

    void registerAgent(Agent agent);
    void removeAgent(const std::string& agent_id);
    void setAgentStatus(const std::string& agent_id, AgentStatus status);

    std::vector<Agent> getAgents() const;
    std::vector<Task> getTasks() const;
    std::vector<Task> getTaskQueue() const;
    OrchestrationMetrics getMetrics() const;
    Agent getAgent(const std::string& agent_id) const;
    Task getTask(const std::string& task_id) const;

    EventBus::Unsubscribe subscribe(const std::string& event_name, EventBus::Handler handler);
    EventBus::Unsubscribe subscribe(EventType type, EventBus::Handler handler);
    EventBus& events() { return bus_; }

    // One periodic step: resource drift, a scheduling pass over the queue,
    // metrics refresh and a metrics_updated notification
    void tick();

    // Blocks until no execution is in flight and its events have been delivered
    bool waitForIdle(std::chrono::milliseconds timeout);

    const OrchestratorConfig& config() const { return config_; }

private:
    void onExecutionFinished(const std::string& task_id, const DispatchResult& result);
    void emit(OrchestratorEvent event);
    void flushEvents();
    void refreshMetrics();
    void tickLoop();

    OrchestratorConfig config_;
    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<RandomSource> random_;
    std::shared_ptr<Dispatcher> dispatcher_;
    EventBus bus_;

    mutable std::mutex state_mutex_; // guards pool, registry, metrics and the pending events
    std::condition_variable idle_cv_;
    std::recursive_mutex publish_mutex_; // keeps delivery in emission order
    std::vector<OrchestratorEvent> pending_events_;
    std::size_t finishing_ = 0;

    AgentPool pool_;
    TaskRegistry registry_;
    LearningController learning_;
    ExecutionEngine engine_;
    Scheduler scheduler_;
    OrchestrationMetrics metrics_;

    std::mutex tick_mutex_;
    std::condition_variable tick_cv_;
    bool ticking_ = false;
    std::thread tick_thread_;
};

#endif // ORCHESTRATOR_HPP
