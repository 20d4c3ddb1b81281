#pragma once
#include <chrono>

class OperationTimer {
public:
    using Clock = std::chrono::steady_clock;

    OperationTimer() : start(Clock::now()) {}

    double elapsed_seconds() const {
        return std::chrono::duration<double>(Clock::now() - start).count();
    }

    void restart() { start = Clock::now(); }

private:
    Clock::time_point start;
};

// Scoped RAII helper: writes the seconds spent in its scope to `out`
class ScopedOperationTimer {
public:
    explicit ScopedOperationTimer(double &out) : out(out) {}
    ~ScopedOperationTimer() { out = timer.elapsed_seconds(); }

    ScopedOperationTimer(const ScopedOperationTimer &) = delete;
    ScopedOperationTimer &operator=(const ScopedOperationTimer &) = delete;

private:
    double &out;
    OperationTimer timer;
};
