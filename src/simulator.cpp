#include "simulator.hpp"
#include "errors.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <string>
#include <thread>
#include <vector>

// Runs body(block, begin, end) over contiguous blocks of [0, n). Returning from this
// function is the phase barrier. The first exception thrown by a worker is
// rethrown on the calling thread after every worker has joined.
template<typename Body>
static void for_blocks(int n, int threads, Body body) {
    if (threads <= 1 || n < 2) {
        body(0, 0, n);
        return;
    }
    threads = std::min(threads, n);
    int chunk = (n + threads - 1) / threads;

    std::vector<std::exception_ptr> errors(threads);
    std::vector<std::thread> pool;
    pool.reserve(threads);

    for (int t = 0; t < threads; t++) {
        int begin = t * chunk;
        int end = std::min(n, begin + chunk);
        pool.emplace_back([&, t, begin, end]() {
            try {
                body(t, begin, end);
            } catch (...) {
                errors[t] = std::current_exception();
            }
        });
    }

    for (auto& th : pool) th.join();
    for (auto& e : errors) if (e) std::rethrow_exception(e);
}

long long deliver_phase(const Graph& g, std::vector<Vertex>& vertices, int threads, std::ostream* trace) {
    if (trace) threads = 1;
    std::vector<long long> sent(std::max(threads, 1), 0);

    // pull form of "for every edge u->v push into v": each receiver only
    // writes its own inbox, senders are read-only
    for_blocks(g.n, threads, [&](int block, int begin, int end) {
        long long local = 0;
        for (int v = begin; v < end; v++) {
            for (int u : g.adj[v]) {
                Coloring c = vertices[u].coloring;
                vertices[v].inbox.push_back(Message{u, c});
                local++;
                if (trace) {
                    *trace << "node " << std::setw(3) << u << ": sending to node " << std::setw(3) << v
                           << ": (" << u << ", " << c << ")\n";
                }
            }
        }
        sent[block] = local;
    });

    long long total = 0;
    for (long long s : sent) total += s;
    return total;
}

int compute_phase(std::vector<Vertex>& vertices, const ColoringPolicy& policy, int round, int threads,
                  std::ostream* trace) {
    if (trace) threads = 1;
    int n = (int)vertices.size();
    std::vector<int> changed(std::max(threads, 1), 0);

    for_blocks(n, threads, [&](int block, int begin, int end) {
        int local = 0;
        for (int i = begin; i < end; i++) {
            Vertex& v = vertices[i];
            if (policy.participates(v)) {
                Coloring next = policy.update(v, round);
                if (trace) {
                    *trace << "node " << std::setw(3) << v.id << ": " << v.coloring << " -> " << next << "\n";
                }
                if (next != v.coloring) local++;
                v.coloring = next;
            }
            v.inbox.clear();
        }
        changed[block] = local;
    });

    int total = 0;
    for (int c : changed) total += c;
    return total;
}

SimulationResult run_simulation(const Graph& g, std::vector<Vertex>& vertices, ColoringPolicy& policy,
                                const SimulationOptions& opt) {
    if (opt.max_rounds <= 0) throw ConfigurationError("max_rounds must be positive");

    SimulationResult res;
    Timer t;

    policy.initialize(g, vertices);
    if (opt.trace) {
        *opt.trace << "Starting " << policy.name() << " coloring on " << g.n << " nodes\n";
        for (auto& v : vertices)
            *opt.trace << "node " << std::setw(3) << v.id << " chose color " << v.coloring << "\n";
    }

    int round = 0;
    while (true) {
        if (round >= opt.max_rounds) {
            throw NonConvergenceError(std::string(policy.name()) + " coloring did not converge within " +
                                          std::to_string(opt.max_rounds) + " rounds",
                                      round);
        }
        round++;
        if (opt.trace) *opt.trace << "\nStarting round " << round << "\n";

        Timer phase;
        RoundStats stats;
        stats.round = round;
        stats.messages = deliver_phase(g, vertices, opt.threads, opt.trace);
        res.phases.deliver += phase.seconds();

        phase.reset();
        stats.changed = compute_phase(vertices, policy, round, opt.threads, opt.trace);
        res.phases.compute += phase.seconds();

        stats.candidates = count_candidates(vertices);
        for (auto& v : vertices) stats.max_color = std::max(stats.max_color, v.coloring.color);
        res.messages += stats.messages;

        if (opt.on_round) opt.on_round(stats, vertices);
        if (policy.converged(vertices, stats)) break;
    }

    policy.finalize(vertices);
    if (opt.trace) *opt.trace << "Finished after " << round << " rounds\n";

    res.converged = true;
    res.rounds = round;
    res.color = colors_of(vertices);
    res.seconds = t.seconds();
    return res;
}
