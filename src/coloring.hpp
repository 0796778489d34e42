#pragma once
#include "graph.hpp"
#include "vertex.hpp"
#include <cstdint>
#include <vector>

// Statistics of one completed round, handed to the convergence check.
struct RoundStats {
    int round = 0;
    long long messages = 0;
    int changed = 0;     // vertices whose coloring differs from the previous round
    int candidates = 0;  // vertices still in Candidate state
    int max_color = 0;
};

// What a vertex does with its inbox each round. The simulator only ever holds
// this interface. update() must only read the vertex it is given, which makes
// it safe to call for different vertices from different threads.
class ColoringPolicy {
public:
    virtual ~ColoringPolicy() = default;

    virtual const char* name() const = 0;

    // Validates the policy against the graph and seeds every vertex.
    virtual void initialize(const Graph& g, std::vector<Vertex>& vertices) = 0;

    virtual bool participates(const Vertex& v) const = 0;

    // Next coloring of v computed from v.coloring and v.inbox.
    virtual Coloring update(const Vertex& v, int round) const = 0;

    virtual bool converged(const std::vector<Vertex>& vertices, const RoundStats& stats) const = 0;

    // Called once after convergence.
    virtual void finalize(std::vector<Vertex>&) const {}
};

// Each Candidate vertex samples from a palette of Δ+1 colors and goes
// Permanent as soon as no neighbor message carries its color.
class RandomizedPolicy : public ColoringPolicy {
public:
    // palette_size <= 0 means Δ+1, taken from the graph in initialize().
    explicit RandomizedPolicy(uint64_t seed, int palette_size = 0);

    const char* name() const override { return "randomized"; }
    void initialize(const Graph& g, std::vector<Vertex>& vertices) override;
    bool participates(const Vertex& v) const override { return !v.coloring.is_permanent(); }
    Coloring update(const Vertex& v, int round) const override;
    bool converged(const std::vector<Vertex>& vertices, const RoundStats& stats) const override;

    int palette_size() const { return palette_; }

private:
    int draw(const std::vector<int>& from, int vertex, int round) const;

    uint64_t seed_;
    int requested_palette_;
    int palette_ = 0;
};

// Colors start at ceil(id/2). Conflict-free vertices above the Δ+1 target
// halve their color; in a same-color conflict only the highest identity among
// the holders moves, to the first color free in its neighborhood.
class HalvingPolicy : public ColoringPolicy {
public:
    const char* name() const override { return "halving"; }
    void initialize(const Graph& g, std::vector<Vertex>& vertices) override;
    bool participates(const Vertex&) const override { return true; }
    Coloring update(const Vertex& v, int round) const override;
    bool converged(const std::vector<Vertex>& vertices, const RoundStats& stats) const override;
    void finalize(std::vector<Vertex>& vertices) const override;

    int target() const { return delta_ + 1; }

private:
    int delta_ = 0;
};

bool verify_coloring(const Graph& g, const std::vector<int>& color, int k);

// Throws InvariantViolation naming every conflicting edge.
void check_proper_coloring(const Graph& g, const std::vector<Vertex>& vertices);

// Throws InvariantViolation if two vertices share a color (complete graphs).
void check_distinct_colors(const std::vector<Vertex>& vertices);
