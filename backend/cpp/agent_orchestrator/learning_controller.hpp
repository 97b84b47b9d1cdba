#ifndef LEARNING_CONTROLLER_HPP
#define LEARNING_CONTROLLER_HPP

#include "agent_pool.hpp"
#include "clock.hpp"
#include "event_bus.hpp"
#include "orchestrator_config.hpp"
#include "random_source.hpp"
#include "task.hpp"

#include <memory>
#include <optional>
#include <string>

// Adapts agent proficiency from execution outcomes and grows the pool when
// demand cannot be met.
class LearningController {
public:
    LearningController(AgentPool& pool, std::shared_ptr<const Clock> clock, std::shared_ptr<RandomSource> random,
                       EventSink emit, const OrchestratorConfig& config);

    // Append the outcome to the agent's history, nudge every capability the task
    // required, and recompute success rate, average time and efficiency over the
    // most recent learning window.
    void recordOutcome(Agent& agent, const Task& task, double duration_ms, bool success);

    // Called when a scheduling pass finds no candidate. Spawns an agent for the
    // first required capability no agent offers at the task's complexity (the
    // first one if all are offered) when the pool is loaded above the threshold
    // and below its size limit. Returns the new id if one was spawned.
    std::optional<std::string> considerSpawning(const Task& task);

private:
    Agent spawnAgent(CapabilityType primary);

    AgentPool& pool_;
    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<RandomSource> random_;
    EventSink emit_;
    const OrchestratorConfig& config_;
};

#endif // LEARNING_CONTROLLER_HPP
