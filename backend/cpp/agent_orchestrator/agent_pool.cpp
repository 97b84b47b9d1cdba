#include "agent_pool.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace {

void validateAgent(const Agent& agent) {
    if (agent.id.empty()) {
        throw std::invalid_argument("Agent id cannot be empty");
    }
    if (agent.capabilities.empty()) {
        throw std::invalid_argument("Agent " + agent.id + " must offer at least one capability");
    }
    for (const auto& capability : agent.capabilities) {
        if (capability.level < kMinCapabilityLevel || capability.level > kMaxCapabilityLevel) {
            throw std::invalid_argument("Agent " + agent.id + " has " + toString(capability.type) +
                                        " level outside [1, 10]");
        }
        if (capability.max_concurrent_tasks < 1) {
            throw std::invalid_argument("Agent " + agent.id + " has " + toString(capability.type) +
                                        " max_concurrent_tasks below 1");
        }
    }
    if (agent.performance.success_rate < 0.0 || agent.performance.success_rate > 1.0) {
        throw std::invalid_argument("Agent " + agent.id + " success_rate must be within [0, 1]");
    }
}

double clampGauge(double value) {
    return std::max(0.0, std::min(1.0, value));
}

} // namespace

void AgentPool::registerAgent(Agent agent) {
    validateAgent(agent);
    if (agents_.count(agent.id) != 0) {
        throw std::runtime_error("Agent " + agent.id + " is already registered");
    }
    if (!agent.current_tasks.empty()) {
        throw std::invalid_argument("Agent " + agent.id + " cannot be registered with tasks in progress");
    }
    agent.refreshStatus();
    const std::string id = agent.id;
    agents_.emplace(id, std::move(agent));
}

void AgentPool::remove(const std::string& agent_id) {
    const Agent& agent = get(agent_id);
    if (!agent.current_tasks.empty()) {
        throw std::runtime_error("Agent " + agent_id + " still has " + std::to_string(agent.current_tasks.size()) +
                                 " active task(s); drain it before removal");
    }
    agents_.erase(agent_id);
}

bool AgentPool::contains(const std::string& agent_id) const {
    return agents_.count(agent_id) != 0;
}

const Agent& AgentPool::get(const std::string& agent_id) const {
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        throw std::runtime_error("Agent " + agent_id + " not found");
    }
    return it->second;
}

Agent& AgentPool::get(const std::string& agent_id) {
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        throw std::runtime_error("Agent " + agent_id + " not found");
    }
    return it->second;
}

std::vector<Agent> AgentPool::list() const {
    std::vector<Agent> result;
    result.reserve(agents_.size());
    for (const auto& [id, agent] : agents_) {
        result.push_back(agent);
    }
    return result;
}

void AgentPool::setStatus(const std::string& agent_id, AgentStatus status) {
    Agent& agent = get(agent_id);
    if (status == AgentStatus::Offline || status == AgentStatus::Maintenance) {
        agent.status = status;
        return;
    }
    agent.status = AgentStatus::Idle;
    agent.refreshStatus();
}

void AgentPool::assignTask(const std::string& agent_id, const std::string& task_id) {
    Agent& agent = get(agent_id);
    if (agent.status == AgentStatus::Offline || agent.status == AgentStatus::Maintenance) {
        throw std::runtime_error("Agent " + agent_id + " is " + toString(agent.status) + " and cannot take work");
    }
    if (agent.isAtCapacity()) {
        throw std::runtime_error("Agent " + agent_id + " is at capacity (" +
                                 std::to_string(agent.maxConcurrentTasks()) + " tasks)");
    }
    agent.current_tasks.insert(task_id);
    agent.refreshStatus();
}

void AgentPool::releaseTask(const std::string& agent_id, const std::string& task_id) {
    Agent& agent = get(agent_id);
    agent.current_tasks.erase(task_id);
    agent.refreshStatus();
}

double AgentPool::systemLoad() const {
    if (agents_.empty()) {
        return 0.0;
    }
    std::size_t busy = 0;
    for (const auto& [id, agent] : agents_) {
        if (agent.status == AgentStatus::Busy || agent.status == AgentStatus::Overloaded) {
            ++busy;
        }
    }
    return static_cast<double>(busy) / static_cast<double>(agents_.size());
}

int AgentPool::totalCapacity() const {
    int total = 0;
    for (const auto& [id, agent] : agents_) {
        total += agent.maxConcurrentTasks();
    }
    return total;
}

int AgentPool::usedCapacity() const {
    int used = 0;
    for (const auto& [id, agent] : agents_) {
        used += static_cast<int>(agent.current_tasks.size());
    }
    return used;
}

void AgentPool::driftResources(RandomSource& random, double amplitude) {
    for (auto& [id, agent] : agents_) {
        agent.resources.cpu = clampGauge(agent.resources.cpu + (random.uniform() - 0.5) * amplitude);
        agent.resources.memory = clampGauge(agent.resources.memory + (random.uniform() - 0.5) * amplitude);
        agent.resources.network = clampGauge(agent.resources.network + (random.uniform() - 0.5) * amplitude);
    }
}

std::string AgentPool::nextSpawnId(CapabilityType type) const {
    const std::string prefix = toString(type);
    for (int index = 1;; ++index) {
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), "-%03d", index);
        std::string candidate = prefix + suffix;
        if (agents_.count(candidate) == 0) {
            return candidate;
        }
    }
}

std::vector<Agent> defaultAgents(TimePoint now) {
    struct Seed {
        const char* id;
        const char* name;
        CapabilityType type;
        double level;
        double resource_cost;
        int max_concurrent_tasks;
        double success_rate;
        double efficiency;
        AgentResources resources;
        Location location;
        std::set<std::string> connections;
    };

    const Seed seeds[] = {
        {"nlp-001", "NLP Master", CapabilityType::Nlp, 9, 3, 5, 1.0, 0.85, {0.2, 0.3, 0.1}, {200, 150},
         {"quantum-001", "swarm-001"}},
        {"quantum-001", "Quantum Processor", CapabilityType::Quantum, 8, 5, 3, 0.95, 0.92, {0.4, 0.6, 0.2},
         {400, 100}, {"nlp-001", "compliance-001", "copilot-001"}},
        {"swarm-001", "Swarm Coordinator", CapabilityType::Swarm, 10, 2, 8, 0.98, 0.88, {0.3, 0.4, 0.8},
         {300, 250}, {"nlp-001", "compliance-001"}},
        {"compliance-001", "Compliance Guardian", CapabilityType::Compliance, 9, 2, 4, 0.99, 0.75,
         {0.2, 0.3, 0.3}, {500, 200}, {"quantum-001", "swarm-001", "copilot-001"}},
        {"copilot-001", "Copilot Hub", CapabilityType::Copilot, 8, 3, 6, 0.93, 0.82, {0.3, 0.4, 0.4},
         {350, 50}, {"quantum-001", "compliance-001"}},
    };

    std::vector<Agent> agents;
    for (const auto& seed : seeds) {
        Agent agent;
        agent.id = seed.id;
        agent.name = seed.name;
        agent.capabilities.push_back(
            {seed.type, seed.level, defaultSpecializations(seed.type), seed.resource_cost, seed.max_concurrent_tasks});
        agent.performance.success_rate = seed.success_rate;
        agent.performance.efficiency = seed.efficiency;
        agent.performance.last_active = now;
        agent.resources = seed.resources;
        agent.location = seed.location;
        agent.connections = seed.connections;
        agents.push_back(std::move(agent));
    }
    return agents;
}
