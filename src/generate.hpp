#pragma once
#include "graph.hpp"
#include "vertex.hpp"
#include <cstdint>
#include <string>

// A graph together with its freshly seeded vertex store and Δ.
struct Topology {
    Graph graph;
    std::vector<Vertex> vertices;
    int delta = 0;
};

Topology make_topology(Graph g);

Graph make_complete(int n);
Graph make_chain(int n);
Graph make_hydrocarbon(int n);
bool is_hydrocarbon_carbon(int v);
Graph make_random_gnp(int n, double p, uint64_t seed);

// shape is one of "complete", "chain", "hydrocarbon"
Topology make_named_topology(const std::string& shape, int n);
