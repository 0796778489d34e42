#include "coloring.hpp"
#include "errors.hpp"

#include <map>
#include <sstream>

bool verify_coloring(const Graph& g, const std::vector<int>& color, int k) {
    if ((int)color.size() != g.n) return false;
    for (int u = 0; u < g.n; u++) {
        if (color[u] < 0 || color[u] >= k) return false;
        for (int v : g.adj[u]) {
            if (u < v && color[u] == color[v]) return false;
        }
    }
    return true;
}

static std::string describe(const char* what, const std::vector<InvariantViolation::Conflict>& conflicts) {
    std::ostringstream os;
    os << what << ":";
    for (auto& c : conflicts) os << " (node " << c.u << ", node " << c.v << ", color " << c.color << ")";
    return os.str();
}

void check_proper_coloring(const Graph& g, const std::vector<Vertex>& vertices) {
    if ((int)vertices.size() != g.n) throw ConfigurationError("vertex count does not match graph");

    std::vector<InvariantViolation::Conflict> conflicts;
    for (int u = 0; u < g.n; u++) {
        for (int v : g.adj[u]) {
            if (u < v && vertices[u].coloring.color == vertices[v].coloring.color)
                conflicts.push_back({u, v, vertices[u].coloring.color});
        }
    }
    if (!conflicts.empty()) throw InvariantViolation(describe("adjacent nodes share a color", conflicts), conflicts);
}

void check_distinct_colors(const std::vector<Vertex>& vertices) {
    std::map<int, int> owner;
    std::vector<InvariantViolation::Conflict> conflicts;
    for (auto& v : vertices) {
        auto it = owner.find(v.coloring.color);
        if (it != owner.end()) conflicts.push_back({it->second, v.id, v.coloring.color});
        else owner.emplace(v.coloring.color, v.id);
    }
    if (!conflicts.empty()) throw InvariantViolation(describe("duplicate color", conflicts), conflicts);
}
