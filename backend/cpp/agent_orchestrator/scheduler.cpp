#include "scheduler.hpp"

#include <algorithm>

namespace {

constexpr double kResourceCeiling = 0.9;
constexpr double kResourcePerComplexity = 0.1;

int priorityRank(TaskPriority priority) {
    switch (priority) {
    case TaskPriority::Critical: return 0;
    case TaskPriority::High: return 1;
    case TaskPriority::Medium: return 2;
    case TaskPriority::Low: return 3;
    }
    return 4;
}

} // namespace

bool hasRequiredCapabilities(const Agent& agent, const Task& task) {
    return std::all_of(task.required_capabilities.begin(), task.required_capabilities.end(),
                       [&](CapabilityType type) {
                           return std::any_of(agent.capabilities.begin(), agent.capabilities.end(),
                                              [&](const Capability& capability) {
                                                  return capability.type == type &&
                                                         capability.level >= task.complexity;
                                              });
                       });
}

bool isAvailable(const Agent& agent) {
    if (agent.status == AgentStatus::Idle) {
        return true;
    }
    return agent.status == AgentStatus::Busy && !agent.isAtCapacity();
}

bool hasResourceHeadroom(const Agent& agent, const Task& task) {
    const double required = task.complexity * kResourcePerComplexity;
    return agent.resources.cpu + required < kResourceCeiling && agent.resources.memory + required < kResourceCeiling;
}

bool isEligible(const Agent& agent, const Task& task) {
    return hasRequiredCapabilities(agent, task) && isAvailable(agent) && hasResourceHeadroom(agent, task);
}

double scoreAgent(const Agent& agent, const Task& task) {
    double capability_match = 0.0;
    if (!task.required_capabilities.empty()) {
        for (CapabilityType type : task.required_capabilities) {
            const Capability* capability = agent.findCapability(type);
            capability_match += capability != nullptr ? capability->level / 10.0 : 0.0;
        }
        capability_match /= static_cast<double>(task.required_capabilities.size());
    }

    const double performance = (agent.performance.success_rate + agent.performance.efficiency) / 2.0;
    const double load_inverse =
        1.0 - static_cast<double>(agent.current_tasks.size()) / static_cast<double>(agent.maxConcurrentTasks());
    const double headroom =
        1.0 - std::max({agent.resources.cpu, agent.resources.memory, agent.resources.network});

    return capability_match * 0.4 + performance * 0.3 + load_inverse * 0.2 + headroom * 0.1;
}

Scheduler::Scheduler(AgentPool& pool, TaskRegistry& registry, LearningController& learning, ExecutionEngine& engine,
                     EventSink emit, const OrchestratorConfig& config)
    : pool_(pool), registry_(registry), learning_(learning), engine_(engine), emit_(std::move(emit)), config_(config) {}

std::vector<std::string> Scheduler::findCandidates(const Task& task) const {
    std::vector<std::string> candidates;
    for (const auto& [id, agent] : pool_.agents()) {
        if (isEligible(agent, task)) {
            candidates.push_back(id);
        }
    }
    return candidates;
}

std::optional<std::string> Scheduler::selectAgent(const Task& task) const {
    std::optional<std::string> best;
    double best_score = 0.0;
    // Candidates come back in id order, so a strict comparison keeps the lowest id on ties
    for (const auto& id : findCandidates(task)) {
        const double score = scoreAgent(pool_.get(id), task);
        if (!best || score > best_score) {
            best = id;
            best_score = score;
        }
    }
    return best;
}

bool Scheduler::schedule(const std::string& task_id) {
    Task& task = registry_.get(task_id);
    if (task.status != TaskStatus::Pending) {
        return false;
    }
    if (config_.enforce_dependencies && !dependenciesReady(task)) {
        return false;
    }

    auto chosen = selectAgent(task);
    if (!chosen) {
        learning_.considerSpawning(task);
        return false;
    }

    bind(task, *chosen);
    engine_.execute(task_id);
    return true;
}

std::size_t Scheduler::drainQueue() {
    std::vector<std::string> ordered(registry_.queuedIds().begin(), registry_.queuedIds().end());
    std::stable_sort(ordered.begin(), ordered.end(), [this](const std::string& a, const std::string& b) {
        return priorityRank(registry_.get(a).priority) < priorityRank(registry_.get(b).priority);
    });

    std::size_t bound = 0;
    for (const auto& task_id : ordered) {
        if (schedule(task_id)) {
            ++bound;
        }
    }
    return bound;
}

// Dependencies the registry has never seen are treated as external and do not block
bool Scheduler::dependenciesReady(const Task& task) const {
    for (const auto& dependency : task.dependencies) {
        if (registry_.contains(dependency) && registry_.get(dependency).status != TaskStatus::Completed) {
            return false;
        }
    }
    return true;
}

void Scheduler::bind(Task& task, const std::string& agent_id) {
    pool_.assignTask(agent_id, task.id);
    task.status = TaskStatus::Assigned;
    task.assigned_agents = {agent_id};
    registry_.dequeue(task.id);

    OrchestratorEvent assigned;
    assigned.type = EventType::TaskAssigned;
    assigned.task = task;
    assigned.agents.push_back(pool_.get(agent_id));
    emit_(std::move(assigned));
}
