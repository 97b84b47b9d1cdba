#ifndef TASK_REGISTRY_HPP
#define TASK_REGISTRY_HPP

#include "clock.hpp"
#include "task.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Owns submitted tasks and the pending queue. The queue keeps submission
// order (plus front insertion for retried tasks); the scheduler decides how
// to consume it.
class TaskRegistry {
public:
    explicit TaskRegistry(std::shared_ptr<const Clock> clock);

    // Validates the submission, stores a pending task at the back of the queue and
    // returns its id. Throws std::invalid_argument for malformed specs.
    std::string submit(TaskSpec spec);

    bool contains(const std::string& task_id) const;
    const Task& get(const std::string& task_id) const;
    Task& get(const std::string& task_id);

    std::vector<Task> list() const;  // submission order
    std::vector<Task> queue() const; // queue order
    const std::vector<std::string>& submissionOrder() const { return order_; }
    const std::deque<std::string>& queuedIds() const { return queue_; }

    void dequeue(const std::string& task_id);
    void requeueFront(const std::string& task_id);

    std::size_t size() const { return tasks_.size(); }
    std::size_t queueLength() const { return queue_.size(); }

private:
    std::shared_ptr<const Clock> clock_;
    std::unordered_map<std::string, Task> tasks_;
    std::vector<std::string> order_;
    std::deque<std::string> queue_;
    std::uint64_t next_id_ = 1;
};

#endif // TASK_REGISTRY_HPP
