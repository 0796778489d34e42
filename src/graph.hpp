#pragma once
#include <algorithm>
#include <stdexcept>
#include <vector>

// Undirected graph. Every edge {u,v} is kept as the two directed edges u->v
// and v->u, so adj[v] lists exactly the senders that deliver into v.
// add_edge does not check for duplicates; callers reading untrusted input do.
struct Graph {
    int n = 0;
    std::vector<std::vector<int>> adj;

    Graph() = default;
    explicit Graph(int n_) : n(n_), adj(n_) {}

    void add_edge(int u, int v) {
        if (u < 0 || v < 0 || u >= n || v >= n) throw std::out_of_range("bad vertex");
        if (u == v) return;
        adj[u].push_back(v);
        adj[v].push_back(u);
    }

    bool has_edge(int u, int v) const {
        if (u < 0 || u >= n) return false;
        return std::find(adj[u].begin(), adj[u].end(), v) != adj[u].end();
    }

    int degree(int u) const { return (int)adj[u].size(); }

    int max_degree() const {
        int d = 0;
        for (auto& lst : adj) d = std::max(d, (int)lst.size());
        return d;
    }

    int m() const {
        long long sum = 0;
        for (auto& lst : adj) sum += (long long)lst.size();
        return (int)(sum / 2);
    }
};
