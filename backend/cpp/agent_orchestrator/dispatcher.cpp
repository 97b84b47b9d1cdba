#include "dispatcher.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

SimulatedDispatcher::SimulatedDispatcher(std::shared_ptr<RandomSource> random, double time_scale)
    : random_(std::move(random)), time_scale_(time_scale) {
    if (!random_) {
        throw std::invalid_argument("SimulatedDispatcher requires a random source");
    }
    if (time_scale_ < 0.0) {
        throw std::invalid_argument("time_scale cannot be negative");
    }
}

double SimulatedDispatcher::estimateDurationMs(int complexity, RandomSource& random) {
    return complexity * 1000.0 + random.uniform() * 2000.0;
}

double SimulatedDispatcher::successProbability(const std::vector<Agent>& agents) {
    if (agents.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& agent : agents) {
        total += agent.performance.success_rate;
    }
    return total / static_cast<double>(agents.size());
}

std::future<DispatchResult> SimulatedDispatcher::dispatch(const Task& task, const std::vector<Agent>& agents) {
    // Both draws happen here, on the caller's thread, so a seeded source gives
    // the same sequence regardless of how completions interleave.
    DispatchResult result;
    result.duration_ms = estimateDurationMs(task.complexity, *random_);
    result.success = random_->uniform() < successProbability(agents);

    const auto wall_time = std::chrono::microseconds(static_cast<long long>(result.duration_ms * time_scale_ * 1000.0));
    if (wall_time.count() <= 0) {
        std::promise<DispatchResult> ready;
        ready.set_value(result);
        return ready.get_future();
    }
    return std::async(std::launch::async, [result, wall_time]() {
        std::this_thread::sleep_for(wall_time);
        return result;
    });
}
