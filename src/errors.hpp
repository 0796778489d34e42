#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Bad input to a run: empty graph, palette smaller than Δ+1, unknown name.
struct ConfigurationError : std::runtime_error {
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Round guard exceeded before the policy reported convergence.
struct NonConvergenceError : std::runtime_error {
    int rounds;

    NonConvergenceError(const std::string& what, int rounds_)
        : std::runtime_error(what), rounds(rounds_) {}
};

// A self-check found two adjacent vertices with the same final color.
// This is a logic defect, not a condition to recover from.
struct InvariantViolation : std::logic_error {
    struct Conflict { int u, v, color; };
    std::vector<Conflict> conflicts;

    InvariantViolation(const std::string& what, std::vector<Conflict> c)
        : std::logic_error(what), conflicts(std::move(c)) {}
};
