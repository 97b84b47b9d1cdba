#ifndef AGENT_POOL_HPP
#define AGENT_POOL_HPP

#include "agent.hpp"
#include "random_source.hpp"

#include <map>
#include <string>
#include <vector>

// Owns every agent. Not synchronised: the orchestrator serialises access.
// Agents are kept ordered by id, which is also the scheduler's tie-break.
class AgentPool {
public:
    // Throws std::invalid_argument for malformed agents, std::runtime_error for duplicate ids
    void registerAgent(Agent agent);

    // Rejected with std::runtime_error while the agent still has current tasks
    void remove(const std::string& agent_id);

    bool contains(const std::string& agent_id) const;
    const Agent& get(const std::string& agent_id) const;
    Agent& get(const std::string& agent_id);
    std::vector<Agent> list() const;
    const std::map<std::string, Agent>& agents() const { return agents_; }
    std::size_t size() const { return agents_.size(); }

    // Offline and maintenance take an agent out of rotation; any other status
    // returns it and lets its load decide between idle, busy and overloaded.
    void setStatus(const std::string& agent_id, AgentStatus status);

    // Bind or release a task. assignTask enforces the capacity bound.
    void assignTask(const std::string& agent_id, const std::string& task_id);
    void releaseTask(const std::string& agent_id, const std::string& task_id);

    double systemLoad() const;
    int totalCapacity() const;
    int usedCapacity() const;

    // Nudge every resource gauge by up to +/- amplitude/2, clamped to [0, 1]
    void driftResources(RandomSource& random, double amplitude);

    // First free "<type>-NNN" id
    std::string nextSpawnId(CapabilityType type) const;

private:
    std::map<std::string, Agent> agents_;
};

// The five agents the orchestrator starts with unless configured otherwise
std::vector<Agent> defaultAgents(TimePoint now);

#endif // AGENT_POOL_HPP
