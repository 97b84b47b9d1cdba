#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <chrono>
#include <cstdint>

using TimePoint = std::chrono::system_clock::time_point;

// Source of wall-clock timestamps for task and agent bookkeeping.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Milliseconds since the Unix epoch, used for JSON and SQLite timestamps
std::int64_t toEpochMillis(TimePoint time);
TimePoint fromEpochMillis(std::int64_t millis);

#endif // CLOCK_HPP
