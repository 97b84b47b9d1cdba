#ifndef METRICS_HPP
#define METRICS_HPP

#include <cstddef>

class AgentPool;
class TaskRegistry;

// Derived view of pool and registry state. Recomputed, never updated in place.
struct OrchestrationMetrics {
    std::size_t total_tasks = 0;
    std::size_t completed_tasks = 0;
    std::size_t failed_tasks = 0;   // terminally failed, requeued critical tasks excluded
    std::size_t retried_tasks = 0;  // executions beyond the first, summed over tasks
    double average_task_time = 0.0; // ms over completed tasks
    double system_load = 0.0;       // busy or overloaded agents / all agents
    double agent_utilization = 0.0; // used capacity / total capacity
    double network_efficiency = 0.0;
    std::size_t queue_length = 0;

    bool operator==(const OrchestrationMetrics& other) const;
    bool operator!=(const OrchestrationMetrics& other) const { return !(*this == other); }
};

OrchestrationMetrics computeMetrics(const AgentPool& pool, const TaskRegistry& registry);

#endif // METRICS_HPP
