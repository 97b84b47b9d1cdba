#include "agent.hpp"

#include <algorithm>
#include <stdexcept>

int Agent::maxConcurrentTasks() const {
    int result = 1;
    for (const auto& capability : capabilities) {
        result = std::max(result, capability.max_concurrent_tasks);
    }
    return result;
}

const Capability* Agent::findCapability(CapabilityType type) const {
    for (const auto& capability : capabilities) {
        if (capability.type == type) {
            return &capability;
        }
    }
    return nullptr;
}

Capability* Agent::findCapability(CapabilityType type) {
    for (auto& capability : capabilities) {
        if (capability.type == type) {
            return &capability;
        }
    }
    return nullptr;
}

bool Agent::isAtCapacity() const {
    return static_cast<int>(current_tasks.size()) >= maxConcurrentTasks();
}

void Agent::refreshStatus() {
    if (status == AgentStatus::Offline || status == AgentStatus::Maintenance) {
        return;
    }
    if (current_tasks.empty()) {
        status = AgentStatus::Idle;
    } else if (isAtCapacity()) {
        status = AgentStatus::Overloaded;
    } else {
        status = AgentStatus::Busy;
    }
}

std::string toString(AgentStatus status) {
    switch (status) {
    case AgentStatus::Idle: return "idle";
    case AgentStatus::Busy: return "busy";
    case AgentStatus::Overloaded: return "overloaded";
    case AgentStatus::Offline: return "offline";
    case AgentStatus::Maintenance: return "maintenance";
    }
    throw std::invalid_argument("Unknown agent status value");
}

AgentStatus parseAgentStatus(const std::string& name) {
    static const AgentStatus statuses[] = {AgentStatus::Idle, AgentStatus::Busy, AgentStatus::Overloaded,
                                           AgentStatus::Offline, AgentStatus::Maintenance};
    for (AgentStatus status : statuses) {
        if (toString(status) == name) {
            return status;
        }
    }
    throw std::invalid_argument("Unknown agent status: " + name);
}
