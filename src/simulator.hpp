#pragma once
#include "coloring.hpp"
#include "graph.hpp"
#include "timer.hpp"
#include "vertex.hpp"

#include <functional>
#include <ostream>
#include <vector>

struct SimulationOptions {
    int max_rounds = 10000;
    int threads = 1;
    std::ostream* trace = nullptr;  // per-node messages when set
    std::function<void(const RoundStats&, const std::vector<Vertex>&)> on_round;
};

struct SimulationResult {
    bool converged = false;
    std::vector<int> color;
    int rounds = 0;
    long long messages = 0;
    double seconds = 0.0;
    PhaseTimes phases;
};

// Copies every sender's current coloring into the inbox of each receiver.
// Returns the number of messages delivered.
long long deliver_phase(const Graph& g, std::vector<Vertex>& vertices, int threads = 1,
                        std::ostream* trace = nullptr);

// Applies the policy to every participating vertex and clears all inboxes.
// Returns the number of vertices whose coloring changed.
int compute_phase(std::vector<Vertex>& vertices, const ColoringPolicy& policy, int round, int threads = 1,
                  std::ostream* trace = nullptr);

// Initializes the vertices with the policy and runs rounds until it reports
// convergence. Throws NonConvergenceError once opt.max_rounds is exceeded.
SimulationResult run_simulation(const Graph& g, std::vector<Vertex>& vertices, ColoringPolicy& policy,
                                const SimulationOptions& opt = SimulationOptions());
