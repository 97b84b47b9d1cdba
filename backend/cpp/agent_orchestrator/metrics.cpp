#include "metrics.hpp"
#include "agent_pool.hpp"
#include "task_registry.hpp"

bool OrchestrationMetrics::operator==(const OrchestrationMetrics& other) const {
    return total_tasks == other.total_tasks && completed_tasks == other.completed_tasks &&
           failed_tasks == other.failed_tasks && retried_tasks == other.retried_tasks &&
           average_task_time == other.average_task_time && system_load == other.system_load &&
           agent_utilization == other.agent_utilization && network_efficiency == other.network_efficiency &&
           queue_length == other.queue_length;
}

OrchestrationMetrics computeMetrics(const AgentPool& pool, const TaskRegistry& registry) {
    OrchestrationMetrics metrics;
    metrics.total_tasks = registry.size();
    metrics.queue_length = registry.queueLength();

    double completed_time = 0.0;
    for (const auto& id : registry.submissionOrder()) {
        const Task& task = registry.get(id);
        if (task.status == TaskStatus::Completed) {
            ++metrics.completed_tasks;
            completed_time += task.actual_duration.value_or(0.0);
        } else if (task.status == TaskStatus::Failed) {
            ++metrics.failed_tasks;
        }
        if (task.attempts > 1) {
            metrics.retried_tasks += static_cast<std::size_t>(task.attempts - 1);
        }
    }

    if (metrics.completed_tasks > 0) {
        metrics.average_task_time = completed_time / static_cast<double>(metrics.completed_tasks);
    }
    if (metrics.total_tasks > 0) {
        metrics.network_efficiency =
            static_cast<double>(metrics.completed_tasks) / static_cast<double>(metrics.total_tasks);
    }

    metrics.system_load = pool.systemLoad();
    const int total_capacity = pool.totalCapacity();
    if (total_capacity > 0) {
        metrics.agent_utilization = static_cast<double>(pool.usedCapacity()) / total_capacity;
    }
    return metrics;
}
