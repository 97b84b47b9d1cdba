#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include "agent_pool.hpp"
#include "event_bus.hpp"
#include "execution_engine.hpp"
#include "learning_controller.hpp"
#include "orchestrator_config.hpp"
#include "task_registry.hpp"

#include <optional>
#include <string>
#include <vector>

// Eligibility filter: every required capability at level >= complexity, spare
// capacity, and cpu/memory headroom of complexity * 0.1 below 0.9.
bool hasRequiredCapabilities(const Agent& agent, const Task& task);
bool isAvailable(const Agent& agent);
bool hasResourceHeadroom(const Agent& agent, const Task& task);
bool isEligible(const Agent& agent, const Task& task);

// 0.4 * capability match + 0.3 * performance + 0.2 * load inverse
// + 0.1 * resource headroom, each term in [0, 1]
double scoreAgent(const Agent& agent, const Task& task);

// Matches pending tasks to agents. Called with the orchestrator's state lock held.
class Scheduler {
public:
    Scheduler(AgentPool& pool, TaskRegistry& registry, LearningController& learning, ExecutionEngine& engine,
              EventSink emit, const OrchestratorConfig& config);

    // One scheduling pass for a pending task. Binds it to the best candidate and
    // starts execution; with no candidate the task stays queued and scaling is
    // considered. Returns true if the task was bound.
    bool schedule(const std::string& task_id);

    // Scheduling pass over the whole queue, highest priority first and queue
    // order within a priority. Returns the number of tasks bound.
    std::size_t drainQueue();

    // Eligible agent ids in id order
    std::vector<std::string> findCandidates(const Task& task) const;

    // Highest score wins; equal scores go to the lowest agent id
    std::optional<std::string> selectAgent(const Task& task) const;

private:
    bool dependenciesReady(const Task& task) const;
    void bind(Task& task, const std::string& agent_id);

    AgentPool& pool_;
    TaskRegistry& registry_;
    LearningController& learning_;
    ExecutionEngine& engine_;
    EventSink emit_;
    const OrchestratorConfig& config_;
};

#endif // SCHEDULER_HPP
