#include "generate.hpp"
#include "errors.hpp"
#include <random>
#include <utility>

static void require_vertices(const char* shape, int n) {
    if (n <= 0) throw ConfigurationError(std::string(shape) + " needs n>=1");
}

Topology make_topology(Graph g) {
    Topology t;
    t.delta = g.max_degree();
    t.vertices = make_vertices(g.n);
    t.graph = std::move(g);
    return t;
}

Graph make_complete(int n) {
    require_vertices("complete graph", n);
    Graph g(n);
    for (int i = 0; i < n; i++)
        for (int j = i + 1; j < n; j++)
            g.add_edge(i, j);
    return g;
}

Graph make_chain(int n) {
    require_vertices("chain", n);
    Graph g(n);
    for (int i = 0; i + 1 < n; i++) g.add_edge(i, i + 1);
    return g;
}

bool is_hydrocarbon_carbon(int v) {
    return v == 0 || (v >= 4 && (v - 4) % 3 == 0);
}

// Alkane-like skeleton. Carbon 0 takes vertices 1..4 like CH4, where 4 is the
// next carbon; after that carbons sit at 4, 7, 10, ..., each followed by two
// hydrogens and bonded to the previous carbon. Every vertex but 0 attaches to
// exactly one earlier vertex, so the result is a tree with n-1 edges and
// degree min(n-1, 4).
Graph make_hydrocarbon(int n) {
    require_vertices("hydrocarbon", n);
    Graph g(n);
    for (int i = 1; i < n; i++) {
        int parent;
        if (i <= 4) parent = 0;
        else if (is_hydrocarbon_carbon(i)) parent = i - 3;
        else parent = i - (i - 4) % 3;
        g.add_edge(parent, i);
    }
    return g;
}

Graph make_random_gnp(int n, double p, uint64_t seed) {
    require_vertices("random graph", n);
    if (p < 0.0 || p > 1.0) throw ConfigurationError("p must be in [0,1]");
    Graph g(n);
    std::mt19937_64 rng(seed);
    std::bernoulli_distribution coin(p);

    for (int i = 0; i < n; i++)
        for (int j = i + 1; j < n; j++)
            if (coin(rng)) g.add_edge(i, j);

    return g;
}

Topology make_named_topology(const std::string& shape, int n) {
    if (shape == "complete") return make_topology(make_complete(n));
    if (shape == "chain") return make_topology(make_chain(n));
    if (shape == "hydrocarbon") return make_topology(make_hydrocarbon(n));
    throw ConfigurationError("Unknown topology: " + shape);
}
