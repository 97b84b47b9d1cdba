#ifndef AGENT_HPP
#define AGENT_HPP

#include "capability.hpp"
#include "clock.hpp"

#include <deque>
#include <set>
#include <string>
#include <vector>

enum class AgentStatus {
    Idle,
    Busy,
    Overloaded,
    Offline,
    Maintenance
};

struct AgentPerformance {
    int tasks_completed = 0;
    double average_completion_time = 0.0; // ms, over the learning window
    double success_rate = 1.0;            // [0, 1]
    double efficiency = 0.0;
    TimePoint last_active{};
};

// Utilisation gauges, each roughly in [0, 1]
struct AgentResources {
    double cpu = 0.0;
    double memory = 0.0;
    double network = 0.0;
};

// Display-only coordinate
struct Location {
    double x = 0.0;
    double y = 0.0;
};

struct TaskRecord {
    std::string task_type;
    double duration_ms = 0.0;
    bool success = false;
};

struct Adaptation {
    CapabilityType capability = CapabilityType::Nlp;
    double delta = 0.0;
    TimePoint timestamp{};
};

struct LearningData {
    std::deque<TaskRecord> task_history; // oldest first, bounded
    std::deque<Adaptation> adaptations;  // oldest first, bounded
};

struct Agent {
    std::string id;
    std::string name;
    std::vector<Capability> capabilities;
    AgentStatus status = AgentStatus::Idle;
    std::set<std::string> current_tasks;
    AgentPerformance performance;
    AgentResources resources;
    Location location;
    std::set<std::string> connections; // topology, display-only
    LearningData learning_data;

    // Largest max_concurrent_tasks across capabilities, never below 1
    int maxConcurrentTasks() const;

    const Capability* findCapability(CapabilityType type) const;
    Capability* findCapability(CapabilityType type);

    bool isAtCapacity() const;

    // Recompute idle/busy/overloaded from current load. Offline and
    // maintenance are sticky and left alone.
    void refreshStatus();
};

std::string toString(AgentStatus status);
AgentStatus parseAgentStatus(const std::string& name);

#endif // AGENT_HPP
