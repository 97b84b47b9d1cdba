#ifndef TASK_HPP
#define TASK_HPP

#include "capability.hpp"
#include "clock.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

enum class TaskPriority {
    Low,
    Medium,
    High,
    Critical
};

enum class TaskStatus {
    Pending,
    Assigned,
    Processing,
    Completed,
    Failed
};

// What a submitter provides. Id, status, assigned agents and creation time are
// filled in by the registry.
struct TaskSpec {
    std::string type;
    TaskPriority priority = TaskPriority::Medium;
    int complexity = 1; // [1, 10]
    std::vector<CapabilityType> required_capabilities;
    nlohmann::json payload;
    std::set<std::string> dependencies;
    double estimated_duration = 0.0; // ms, 0 lets the registry estimate from complexity
    std::optional<TimePoint> deadline;
};

struct Task {
    std::string id;
    std::string type;
    TaskPriority priority = TaskPriority::Medium;
    int complexity = 1;
    std::vector<CapabilityType> required_capabilities; // non-empty, first one drives scaling
    nlohmann::json payload;
    std::set<std::string> dependencies; // recorded; only checked when dependency gating is on
    TaskStatus status = TaskStatus::Pending;
    std::vector<std::string> assigned_agents;
    TimePoint created_at{};
    double estimated_duration = 0.0;
    std::optional<double> actual_duration;
    std::optional<TimePoint> deadline;
    int attempts = 0; // executions started so far
};

std::string toString(TaskPriority priority);
std::string toString(TaskStatus status);
TaskPriority parseTaskPriority(const std::string& name);
TaskStatus parseTaskStatus(const std::string& name);

bool isTerminal(TaskStatus status);

#endif // TASK_HPP
