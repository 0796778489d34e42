#include "coloring.hpp"
#include "errors.hpp"

#include <algorithm>
#include <vector>

void HalvingPolicy::initialize(const Graph& g, std::vector<Vertex>& vertices) {
    if (g.n <= 0) throw ConfigurationError("halving coloring needs at least one vertex");
    if ((int)vertices.size() != g.n) throw ConfigurationError("vertex count does not match graph");

    delta_ = g.max_degree();
    for (auto& v : vertices) {
        v.coloring = Coloring::candidate((v.id + 1) / 2);
        v.inbox.clear();
    }
}

Coloring HalvingPolicy::update(const Vertex& v, int) const {
    int own = v.coloring.color;

    std::vector<int> seen;
    seen.reserve(v.inbox.size());
    int holder = v.id;
    for (auto& msg : v.inbox) {
        seen.push_back(msg.coloring.color);
        if (msg.coloring.color == own) holder = std::max(holder, msg.sender);
    }
    std::sort(seen.begin(), seen.end());
    seen.erase(std::unique(seen.begin(), seen.end()), seen.end());

    bool conflict = std::binary_search(seen.begin(), seen.end(), own);
    if (!conflict) {
        if (own > target()) return Coloring::candidate(own / 2);
        return v.coloring;
    }

    // someone with a larger identity resolves this clash
    if (holder != v.id) return v.coloring;

    int first_free = 0;
    for (int c : seen) {
        if (c != first_free) break;
        first_free++;
    }
    return Coloring::candidate(first_free);
}

bool HalvingPolicy::converged(const std::vector<Vertex>&, const RoundStats& stats) const {
    return stats.round >= 1 && stats.changed == 0 && stats.max_color <= target();
}

void HalvingPolicy::finalize(std::vector<Vertex>& vertices) const {
    for (auto& v : vertices) v.coloring = Coloring::permanent(v.coloring.color);
}
