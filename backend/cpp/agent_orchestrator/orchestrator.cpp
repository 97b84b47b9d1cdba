#include "orchestrator.hpp"

#include <iostream>
#include <stdexcept>

// Orchestrator: owns the agent pool and task registry and drives them through
// one state lock. Submissions are scheduled synchronously; execution runs
// through the dispatcher and comes back on a waiter thread, which applies the
// outcome, feeds the learning controller and runs another scheduling pass.
// Events raised while the lock is held are queued and delivered after it is
// released, so subscribers may call back into the orchestrator.

namespace {

std::shared_ptr<const Clock> orDefault(std::shared_ptr<const Clock> clock) {
    return clock ? std::move(clock) : std::make_shared<SystemClock>();
}

std::shared_ptr<RandomSource> orDefault(std::shared_ptr<RandomSource> random, unsigned int seed) {
    return random ? std::move(random) : std::make_shared<MersenneRandom>(seed);
}

} // namespace

Orchestrator::Orchestrator(OrchestratorConfig config, std::shared_ptr<Dispatcher> dispatcher,
                           std::shared_ptr<const Clock> clock, std::shared_ptr<RandomSource> random)
    : config_(std::move(config)),
      clock_(orDefault(std::move(clock))),
      random_(orDefault(std::move(random), config_.rng_seed)),
      dispatcher_(dispatcher ? std::move(dispatcher)
                             : std::make_shared<SimulatedDispatcher>(random_, config_.time_scale)),
      registry_(clock_),
      learning_(pool_, clock_, random_, [this](OrchestratorEvent event) { emit(std::move(event)); }, config_),
      engine_(pool_, registry_, learning_, dispatcher_, clock_,
              [this](OrchestratorEvent event) { emit(std::move(event)); }, config_),
      scheduler_(pool_, registry_, learning_, engine_, [this](OrchestratorEvent event) { emit(std::move(event)); },
                 config_) {
    engine_.setCompletionHandler(
        [this](const std::string& task_id, const DispatchResult& result) { onExecutionFinished(task_id, result); });

    if (config_.seed_default_agents) {
        for (auto& agent : defaultAgents(clock_->now())) {
            pool_.registerAgent(std::move(agent));
        }
    }
    for (auto agent : config_.agents) {
        agent.performance.last_active = clock_->now();
        pool_.registerAgent(std::move(agent));
    }
    refreshMetrics();
}

Orchestrator::~Orchestrator() {
    stop();
}

void Orchestrator::start() {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    if (ticking_) {
        return;
    }
    ticking_ = true;
    tick_thread_ = std::thread(&Orchestrator::tickLoop, this);
}

void Orchestrator::stop() {
    {
        std::lock_guard<std::mutex> lock(tick_mutex_);
        ticking_ = false;
    }
    tick_cv_.notify_all();
    if (tick_thread_.joinable()) {
        tick_thread_.join();
    }

    // Completions may start further executions, so keep collecting until none remain
    for (;;) {
        std::vector<std::future<void>> waiters;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            waiters = engine_.takeWaiters();
        }
        if (waiters.empty()) {
            break;
        }
        for (auto& waiter : waiters) {
            waiter.wait();
        }
    }
}

void Orchestrator::tickLoop() {
    std::unique_lock<std::mutex> lock(tick_mutex_);
    const auto interval = std::chrono::milliseconds(config_.tick_interval_ms);
    while (ticking_) {
        if (tick_cv_.wait_for(lock, interval, [this] { return !ticking_; })) {
            break;
        }
        lock.unlock();
        try {
            tick();
        } catch (const std::exception& e) {
            std::cerr << "Error: orchestration tick failed: " << e.what() << std::endl;
        }
        lock.lock();
    }
}

std::string Orchestrator::submitTask(TaskSpec spec) {
    std::string task_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        task_id = registry_.submit(std::move(spec));

        OrchestratorEvent submitted;
        submitted.type = EventType::TaskSubmitted;
        submitted.task = registry_.get(task_id);
        emit(std::move(submitted));

        scheduler_.schedule(task_id);
        refreshMetrics();
    }
    flushEvents();
    return task_id;
}

void Orchestrator::registerAgent(Agent agent) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        agent.performance.last_active = clock_->now();
        pool_.registerAgent(std::move(agent));
        scheduler_.drainQueue();
        refreshMetrics();
    }
    flushEvents();
}

void Orchestrator::removeAgent(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    pool_.remove(agent_id);
    refreshMetrics();
}

void Orchestrator::setAgentStatus(const std::string& agent_id, AgentStatus status) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pool_.setStatus(agent_id, status);
        if (status != AgentStatus::Offline && status != AgentStatus::Maintenance) {
            scheduler_.drainQueue();
        }
        refreshMetrics();
    }
    flushEvents();
}

std::vector<Agent> Orchestrator::getAgents() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pool_.list();
}

std::vector<Task> Orchestrator::getTasks() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return registry_.list();
}

std::vector<Task> Orchestrator::getTaskQueue() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return registry_.queue();
}

OrchestrationMetrics Orchestrator::getMetrics() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return metrics_;
}

Agent Orchestrator::getAgent(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pool_.get(agent_id);
}

Task Orchestrator::getTask(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return registry_.get(task_id);
}

EventBus::Unsubscribe Orchestrator::subscribe(const std::string& event_name, EventBus::Handler handler) {
    return bus_.subscribe(event_name, std::move(handler));
}

EventBus::Unsubscribe Orchestrator::subscribe(EventType type, EventBus::Handler handler) {
    return bus_.subscribe(type, std::move(handler));
}

void Orchestrator::tick() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (config_.resource_drift > 0.0) {
            pool_.driftResources(*random_, config_.resource_drift);
        }
        scheduler_.drainQueue();
        refreshMetrics();

        OrchestratorEvent updated;
        updated.type = EventType::MetricsUpdated;
        updated.metrics = metrics_;
        emit(std::move(updated));
    }
    flushEvents();
}

bool Orchestrator::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return engine_.inFlight() == 0 && finishing_ == 0; });
}

void Orchestrator::onExecutionFinished(const std::string& task_id, const DispatchResult& result) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++finishing_;
    }
    // Balances the increment above however the outcome handling exits
    struct FinishingGuard {
        Orchestrator& owner;
        ~FinishingGuard() {
            {
                std::lock_guard<std::mutex> lock(owner.state_mutex_);
                --owner.finishing_;
            }
            owner.idle_cv_.notify_all();
        }
    } finishing_guard{*this};

    try {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            engine_.applyOutcome(task_id, result);
            // The released agent may now fit something still queued
            scheduler_.drainQueue();
            refreshMetrics();
        }
        flushEvents();
    } catch (const std::exception& e) {
        std::cerr << "Error: failed to apply outcome of task " << task_id << ": " << e.what() << std::endl;
    }
}

void Orchestrator::emit(OrchestratorEvent event) {
    pending_events_.push_back(std::move(event));
}

void Orchestrator::flushEvents() {
    std::lock_guard<std::recursive_mutex> publish_lock(publish_mutex_);
    std::vector<OrchestratorEvent> events;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        events.swap(pending_events_);
    }
    for (const auto& event : events) {
        bus_.publish(event);
    }
}

void Orchestrator::refreshMetrics() {
    metrics_ = computeMetrics(pool_, registry_);
}
