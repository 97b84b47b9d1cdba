#include "learning_controller.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

LearningController::LearningController(AgentPool& pool, std::shared_ptr<const Clock> clock,
                                       std::shared_ptr<RandomSource> random, EventSink emit,
                                       const OrchestratorConfig& config)
    : pool_(pool), clock_(std::move(clock)), random_(std::move(random)), emit_(std::move(emit)), config_(config) {}

void LearningController::recordOutcome(Agent& agent, const Task& task, double duration_ms, bool success) {
    auto& learning = agent.learning_data;
    learning.task_history.push_back({task.type, duration_ms, success});
    while (static_cast<int>(learning.task_history.size()) > config_.task_history_capacity) {
        learning.task_history.pop_front();
    }

    const double delta = success ? config_.success_delta : config_.failure_delta;
    for (CapabilityType type : task.required_capabilities) {
        Capability* capability = agent.findCapability(type);
        if (capability == nullptr) {
            continue;
        }
        const double new_level = clampLevel(capability->level + delta);
        if (new_level != capability->level) {
            capability->level = new_level;
            learning.adaptations.push_back({type, delta, clock_->now()});
            while (static_cast<int>(learning.adaptations.size()) > config_.adaptation_log_capacity) {
                learning.adaptations.pop_front();
            }
        }
    }

    const std::size_t window = std::min(learning.task_history.size(), static_cast<std::size_t>(config_.learning_window));
    if (window == 0) {
        return;
    }
    std::size_t successes = 0;
    double total_duration = 0.0;
    for (auto it = learning.task_history.end() - static_cast<std::ptrdiff_t>(window); it != learning.task_history.end();
         ++it) {
        if (it->success) {
            ++successes;
        }
        total_duration += it->duration_ms;
    }

    auto& performance = agent.performance;
    performance.success_rate = static_cast<double>(successes) / static_cast<double>(window);
    performance.average_completion_time = total_duration / static_cast<double>(window);
    performance.efficiency =
        performance.success_rate * (1.0 / std::max(1.0, performance.average_completion_time / 1000.0));
}

std::optional<std::string> LearningController::considerSpawning(const Task& task) {
    if (task.required_capabilities.empty()) {
        return std::nullopt;
    }
    if (pool_.systemLoad() <= config_.scale_load_threshold ||
        static_cast<int>(pool_.size()) >= config_.max_pool_size) {
        return std::nullopt;
    }

    // Grow the pool in the capability nobody offers at the task's complexity
    CapabilityType unmet = task.required_capabilities.front();
    for (CapabilityType type : task.required_capabilities) {
        const bool offered = std::any_of(pool_.agents().begin(), pool_.agents().end(), [&](const auto& entry) {
            const Capability* capability = entry.second.findCapability(type);
            return capability != nullptr && capability->level >= task.complexity;
        });
        if (!offered) {
            unmet = type;
            break;
        }
    }

    Agent agent = spawnAgent(unmet);
    const std::string id = agent.id;
    pool_.registerAgent(agent);

    OrchestratorEvent event;
    event.type = EventType::AgentSpawned;
    event.agents.push_back(pool_.get(id));
    emit_(std::move(event));
    return id;
}

Agent LearningController::spawnAgent(CapabilityType primary) {
    RandomSource& random = *random_;

    Agent agent;
    agent.id = pool_.nextSpawnId(primary);
    std::string label = toString(primary);
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    agent.name = label + " Agent " + agent.id.substr(agent.id.size() - 3);

    Capability capability;
    capability.type = primary;
    capability.level = clampLevel(5.0 + random.uniform() * 3.0);
    capability.specializations = defaultSpecializations(primary);
    capability.resource_cost = 2.0 + random.uniform() * 2.0;
    capability.max_concurrent_tasks = 3 + static_cast<int>(std::floor(random.uniform() * 3.0));
    agent.capabilities.push_back(capability);

    agent.status = AgentStatus::Idle;
    agent.performance.success_rate = 0.8 + random.uniform() * 0.15;
    agent.performance.efficiency = 0.7 + random.uniform() * 0.2;
    agent.performance.last_active = clock_->now();
    agent.resources = {0.1, 0.2, 0.1};
    agent.location = {100.0 + random.uniform() * 500.0, 50.0 + random.uniform() * 300.0};
    return agent;
}
