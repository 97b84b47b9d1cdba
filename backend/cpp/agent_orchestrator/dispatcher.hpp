#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include "agent.hpp"
#include "random_source.hpp"
#include "task.hpp"

#include <future>
#include <memory>
#include <vector>

struct DispatchResult {
    bool success = false;
    double duration_ms = 0.0;
};

// Hands a bound task to the agents that will run it. The returned future is
// awaited off the scheduling path; dispatch() itself must not block.
class Dispatcher {
public:
    virtual ~Dispatcher() = default;
    virtual std::future<DispatchResult> dispatch(const Task& task, const std::vector<Agent>& agents) = 0;
};

// Stands in for real workers: duration is complexity*1000 ms plus up to 2 s of
// jitter, and success is a draw against the agents' mean success rate. The
// future resolves after duration * time_scale of wall time.
class SimulatedDispatcher : public Dispatcher {
public:
    SimulatedDispatcher(std::shared_ptr<RandomSource> random, double time_scale);

    std::future<DispatchResult> dispatch(const Task& task, const std::vector<Agent>& agents) override;

    static double estimateDurationMs(int complexity, RandomSource& random);
    static double successProbability(const std::vector<Agent>& agents);

private:
    std::shared_ptr<RandomSource> random_;
    double time_scale_;
};

#endif // DISPATCHER_HPP
