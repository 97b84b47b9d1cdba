#ifndef RANDOM_SOURCE_HPP
#define RANDOM_SOURCE_HPP

#include <mutex>
#include <random>

// Uniform draws in [0, 1). Everything stochastic in the orchestrator (execution
// jitter, success draws, spawned-agent proficiency, resource drift) goes through
// one of these so a seeded or scripted source makes runs reproducible.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double uniform() = 0;
};

class MersenneRandom : public RandomSource {
public:
    explicit MersenneRandom(unsigned int seed);
    double uniform() override;

private:
    std::mutex mutex_; // draws may come from dispatcher worker threads
    std::mt19937 engine_;
    std::uniform_real_distribution<double> distribution_;
};

#endif // RANDOM_SOURCE_HPP
