#include "task.hpp"

#include <stdexcept>

std::string toString(TaskPriority priority) {
    switch (priority) {
    case TaskPriority::Low: return "low";
    case TaskPriority::Medium: return "medium";
    case TaskPriority::High: return "high";
    case TaskPriority::Critical: return "critical";
    }
    throw std::invalid_argument("Unknown task priority value");
}

std::string toString(TaskStatus status) {
    switch (status) {
    case TaskStatus::Pending: return "pending";
    case TaskStatus::Assigned: return "assigned";
    case TaskStatus::Processing: return "processing";
    case TaskStatus::Completed: return "completed";
    case TaskStatus::Failed: return "failed";
    }
    throw std::invalid_argument("Unknown task status value");
}

TaskPriority parseTaskPriority(const std::string& name) {
    static const TaskPriority priorities[] = {TaskPriority::Low, TaskPriority::Medium, TaskPriority::High,
                                              TaskPriority::Critical};
    for (TaskPriority priority : priorities) {
        if (toString(priority) == name) {
            return priority;
        }
    }
    throw std::invalid_argument("Unknown task priority: " + name);
}

TaskStatus parseTaskStatus(const std::string& name) {
    static const TaskStatus statuses[] = {TaskStatus::Pending, TaskStatus::Assigned, TaskStatus::Processing,
                                          TaskStatus::Completed, TaskStatus::Failed};
    for (TaskStatus status : statuses) {
        if (toString(status) == name) {
            return status;
        }
    }
    throw std::invalid_argument("Unknown task status: " + name);
}

bool isTerminal(TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed;
}
