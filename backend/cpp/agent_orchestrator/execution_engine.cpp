#include "execution_engine.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

ExecutionEngine::ExecutionEngine(AgentPool& pool, TaskRegistry& registry, LearningController& learning,
                                 std::shared_ptr<Dispatcher> dispatcher, std::shared_ptr<const Clock> clock,
                                 EventSink emit, const OrchestratorConfig& config)
    : pool_(pool),
      registry_(registry),
      learning_(learning),
      dispatcher_(std::move(dispatcher)),
      clock_(std::move(clock)),
      emit_(std::move(emit)),
      config_(config) {
    if (!dispatcher_) {
        throw std::invalid_argument("ExecutionEngine requires a dispatcher");
    }
}

void ExecutionEngine::execute(const std::string& task_id) {
    Task& task = registry_.get(task_id);
    if (task.status != TaskStatus::Assigned) {
        throw std::runtime_error("Task " + task_id + " cannot start from status " + toString(task.status));
    }
    task.status = TaskStatus::Processing;
    ++task.attempts;

    OrchestratorEvent started;
    started.type = EventType::TaskStarted;
    started.task = task;
    emit_(std::move(started));

    std::vector<Agent> agents;
    for (const auto& agent_id : task.assigned_agents) {
        agents.push_back(pool_.get(agent_id));
    }

    std::future<DispatchResult> pending;
    try {
        pending = dispatcher_->dispatch(task, agents);
    } catch (const std::exception& e) {
        std::cerr << "Warning: dispatch of task " << task_id << " failed: " << e.what() << std::endl;
        std::promise<DispatchResult> failed;
        failed.set_value(DispatchResult{false, 0.0});
        pending = failed.get_future();
    }

    ++in_flight_;
    pruneWaiters();
    const auto timeout = timeoutFor(task);
    waiters_.push_back(std::async(std::launch::async,
                                  [this, task_id, timeout, pending = std::move(pending)]() mutable {
                                      await(task_id, std::move(pending), timeout);
                                  }));
}

void ExecutionEngine::await(const std::string& task_id, std::future<DispatchResult> pending,
                            std::chrono::milliseconds timeout) {
    DispatchResult result;
    try {
        if (timeout.count() > 0 && pending.wait_for(timeout) != std::future_status::ready) {
            std::cerr << "Warning: task " << task_id << " exceeded its " << timeout.count()
                      << " ms execution budget, marking it failed" << std::endl;
            result = DispatchResult{false, static_cast<double>(timeout.count())};
        } else {
            result = pending.get();
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: execution of task " << task_id << " failed: " << e.what() << std::endl;
        result = DispatchResult{false, 0.0};
    }

    if (on_finished_) {
        on_finished_(task_id, result);
    }
}

void ExecutionEngine::applyOutcome(const std::string& task_id, const DispatchResult& result) {
    if (in_flight_ > 0) {
        --in_flight_;
    }

    Task& task = registry_.get(task_id);
    if (task.status != TaskStatus::Processing) {
        std::cerr << "Warning: ignoring outcome for task " << task_id << " in status " << toString(task.status)
                  << std::endl;
        return;
    }

    const TimePoint now = clock_->now();
    task.actual_duration = result.duration_ms;
    task.status = result.success ? TaskStatus::Completed : TaskStatus::Failed;

    for (const auto& agent_id : task.assigned_agents) {
        if (!pool_.contains(agent_id)) {
            continue;
        }
        pool_.releaseTask(agent_id, task_id);
        Agent& agent = pool_.get(agent_id);
        agent.performance.last_active = now;
        if (result.success) {
            ++agent.performance.tasks_completed;
        }
        learning_.recordOutcome(agent, task, result.duration_ms, result.success);
    }

    OrchestratorEvent outcome;
    outcome.type = result.success ? EventType::TaskCompleted : EventType::TaskFailed;
    outcome.task = task;

    if (!result.success && task.priority == TaskPriority::Critical) {
        if (task.attempts <= config_.max_critical_retries) {
            task.status = TaskStatus::Pending;
            task.assigned_agents.clear();
            registry_.requeueFront(task_id);
        } else {
            std::cerr << "Warning: critical task " << task_id << " failed after " << task.attempts
                      << " attempts, giving up" << std::endl;
        }
    }

    emit_(std::move(outcome));
}

std::vector<std::future<void>> ExecutionEngine::takeWaiters() {
    std::vector<std::future<void>> taken;
    taken.swap(waiters_);
    return taken;
}

std::chrono::milliseconds ExecutionEngine::timeoutFor(const Task& task) const {
    if (config_.execution_timeout_factor <= 0.0) {
        return std::chrono::milliseconds(0);
    }
    // Upper bound of the simulated estimate, or the submitter's own estimate if larger
    const double base = std::max(task.estimated_duration, task.complexity * 1000.0 + 2000.0);
    const double budget = config_.execution_timeout_factor * base * std::max(1.0, config_.time_scale);
    return std::chrono::milliseconds(static_cast<long long>(budget));
}

void ExecutionEngine::pruneWaiters() {
    waiters_.erase(std::remove_if(waiters_.begin(), waiters_.end(),
                                  [](std::future<void>& waiter) {
                                      return waiter.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                  }),
                   waiters_.end());
}
