#pragma once
#include <chrono>

struct Timer {
    using clock = std::chrono::steady_clock;
    clock::time_point start = clock::now();

    void reset() { start = clock::now(); }

    double seconds() const {
        std::chrono::duration<double> diff = clock::now() - start;
        return diff.count();
    }
};

// Wall time split by simulation phase.
struct PhaseTimes {
    double deliver = 0.0;
    double compute = 0.0;

    double total() const { return deliver + compute; }
};
