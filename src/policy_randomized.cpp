#include "coloring.hpp"
#include "errors.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

RandomizedPolicy::RandomizedPolicy(uint64_t seed, int palette_size)
    : seed_(seed), requested_palette_(palette_size) {}

// Independent stream per (seed, vertex, round), so results do not depend on
// the order or the thread in which vertices are updated.
int RandomizedPolicy::draw(const std::vector<int>& from, int vertex, int round) const {
    std::seed_seq seq{(uint32_t)seed_, (uint32_t)(seed_ >> 32), (uint32_t)vertex, (uint32_t)round};
    std::mt19937_64 rng(seq);
    std::uniform_int_distribution<size_t> pick(0, from.size() - 1);
    return from[pick(rng)];
}

void RandomizedPolicy::initialize(const Graph& g, std::vector<Vertex>& vertices) {
    if (g.n <= 0) throw ConfigurationError("randomized coloring needs at least one vertex");
    if ((int)vertices.size() != g.n) throw ConfigurationError("vertex count does not match graph");

    int needed = g.max_degree() + 1;
    palette_ = requested_palette_ > 0 ? requested_palette_ : needed;
    if (palette_ < needed) {
        throw ConfigurationError("palette of " + std::to_string(palette_) +
                                 " colors is smaller than delta+1=" + std::to_string(needed));
    }

    std::vector<int> all(palette_);
    for (int c = 0; c < palette_; c++) all[c] = c;

    for (auto& v : vertices) {
        v.coloring = Coloring::candidate(draw(all, v.id, 0));
        v.inbox.clear();
    }
}

Coloring RandomizedPolicy::update(const Vertex& v, int round) const {
    switch (v.coloring.status) {
        case Coloring::Status::Permanent:
            return v.coloring;
        case Coloring::Status::Candidate:
            break;
    }

    std::vector<char> taken(palette_, 0);     // held by a Permanent neighbor
    std::vector<char> contested(palette_, 0); // held by any neighbor
    for (auto& msg : v.inbox) {
        int c = msg.coloring.color;
        if (c < 0 || c >= palette_) continue;
        contested[c] = 1;
        if (msg.coloring.is_permanent()) taken[c] = 1;
    }

    int own = v.coloring.color;
    if (own >= 0 && own < palette_ && !contested[own]) return Coloring::permanent(own);

    std::vector<int> available;
    available.reserve(palette_);
    for (int c = 0; c < palette_; c++) if (!taken[c]) available.push_back(c);

    if (available.empty()) {
        throw ConfigurationError("node " + std::to_string(v.id) + " has no free color in a palette of " +
                                 std::to_string(palette_));
    }
    return Coloring::candidate(draw(available, v.id, round));
}

bool RandomizedPolicy::converged(const std::vector<Vertex>&, const RoundStats& stats) const {
    return stats.candidates == 0;
}
