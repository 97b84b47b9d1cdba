#include "random_source.hpp"

MersenneRandom::MersenneRandom(unsigned int seed) : engine_(seed), distribution_(0.0, 1.0) {}

double MersenneRandom::uniform() {
    std::lock_guard<std::mutex> lock(mutex_);
    return distribution_(engine_);
}
