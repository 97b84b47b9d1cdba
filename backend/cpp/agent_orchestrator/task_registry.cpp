#include "task_registry.hpp"

#include <algorithm>
#include <stdexcept>

TaskRegistry::TaskRegistry(std::shared_ptr<const Clock> clock) : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("TaskRegistry requires a clock");
    }
}

std::string TaskRegistry::submit(TaskSpec spec) {
    if (spec.required_capabilities.empty()) {
        throw std::invalid_argument("Task must require at least one capability");
    }
    if (spec.complexity < 1 || spec.complexity > 10) {
        throw std::invalid_argument("Task complexity must be within [1, 10], got " + std::to_string(spec.complexity));
    }
    if (spec.estimated_duration < 0.0) {
        throw std::invalid_argument("Task estimated_duration cannot be negative");
    }

    Task task;
    task.id = "task_" + std::to_string(next_id_++);
    task.type = std::move(spec.type);
    task.priority = spec.priority;
    task.complexity = spec.complexity;
    // Keep first-seen order; the first capability drives scaling decisions
    for (CapabilityType type : spec.required_capabilities) {
        if (std::find(task.required_capabilities.begin(), task.required_capabilities.end(), type) ==
            task.required_capabilities.end()) {
            task.required_capabilities.push_back(type);
        }
    }
    task.payload = std::move(spec.payload);
    task.dependencies = std::move(spec.dependencies);
    task.status = TaskStatus::Pending;
    task.created_at = clock_->now();
    task.estimated_duration =
        spec.estimated_duration > 0.0 ? spec.estimated_duration : static_cast<double>(spec.complexity) * 1000.0;
    task.deadline = spec.deadline;

    const std::string id = task.id;
    tasks_.emplace(id, std::move(task));
    order_.push_back(id);
    queue_.push_back(id);
    return id;
}

bool TaskRegistry::contains(const std::string& task_id) const {
    return tasks_.count(task_id) != 0;
}

const Task& TaskRegistry::get(const std::string& task_id) const {
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        throw std::runtime_error("Task ID " + task_id + " not found");
    }
    return it->second;
}

Task& TaskRegistry::get(const std::string& task_id) {
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        throw std::runtime_error("Task ID " + task_id + " not found");
    }
    return it->second;
}

std::vector<Task> TaskRegistry::list() const {
    std::vector<Task> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(tasks_.at(id));
    }
    return result;
}

std::vector<Task> TaskRegistry::queue() const {
    std::vector<Task> result;
    result.reserve(queue_.size());
    for (const auto& id : queue_) {
        result.push_back(tasks_.at(id));
    }
    return result;
}

void TaskRegistry::dequeue(const std::string& task_id) {
    queue_.erase(std::remove(queue_.begin(), queue_.end(), task_id), queue_.end());
}

void TaskRegistry::requeueFront(const std::string& task_id) {
    if (!contains(task_id)) {
        throw std::runtime_error("Task ID " + task_id + " not found");
    }
    dequeue(task_id);
    queue_.push_front(task_id);
}
