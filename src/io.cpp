#include "io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <stdexcept>

static std::string os_cause() {
    return errno ? std::string(" (") + std::strerror(errno) + ")" : std::string();
}

Graph read_graph_edge_list(const std::string& path, bool one_based) {
    errno = 0;
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open file: " + path + os_cause());

    int n = 0, m = 0;
    in >> n >> m;
    if (!in || n < 0 || m < 0) throw std::runtime_error("Bad header (n m) in file: " + path);

    Graph g(n);
    for (int i = 0; i < m; i++) {
        int u, v;
        in >> u >> v;
        if (!in) throw std::runtime_error("Bad edge line in file: " + path);
        if (one_based) { u--; v--; }
        if (!g.has_edge(u, v)) g.add_edge(u, v);
    }
    return g;
}

void write_graph_edge_list(const std::string& path, const Graph& g, bool one_based) {
    errno = 0;
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Cannot write file: " + path + os_cause());

    out << g.n << " " << g.m() << "\n";
    for (int u = 0; u < g.n; u++) {
        for (int v : g.adj[u]) {
            if (u < v) {
                int a = one_based ? (u + 1) : u;
                int b = one_based ? (v + 1) : v;
                out << a << " " << b << "\n";
            }
        }
    }
    if (!out) throw std::runtime_error("Cannot write file: " + path + os_cause());
}

void print_coloring(std::ostream& os, const std::vector<Vertex>& vertices, bool by_color) {
    std::vector<const Vertex*> order;
    order.reserve(vertices.size());
    for (auto& v : vertices) order.push_back(&v);
    if (by_color) {
        std::stable_sort(order.begin(), order.end(), [](const Vertex* a, const Vertex* b) {
            return a->coloring.color < b->coloring.color;
        });
    }
    for (auto* v : order) {
        os << "node " << std::setw(3) << v->id
           << (v->coloring.is_permanent() ? " has permanent color " : " has candidate color ")
           << std::setw(3) << v->coloring.color << "\n";
    }
}

std::string display_color(int c) {
    static const char* named[] = {"red", "green", "blue", "yellow", "orange",
                                  "purple", "cyan", "magenta", "brown", "pink"};
    const int count = (int)(sizeof(named) / sizeof(named[0]));
    if (c >= 0 && c < count) return named[c];

    // golden-ratio hue walk keeps later indices distinct
    double hue = (c * 0.618033988749895);
    hue -= (long long)hue;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f 0.650 0.950", hue);
    return buf;
}

void write_coloring_dot(std::ostream& os, const Graph& g, const std::vector<Vertex>& vertices) {
    os << "graph coloring {\n";
    os << "    node [style=filled];\n";
    for (auto& v : vertices) {
        os << "    " << v.id << " [label=\"" << v.id << ":" << v.coloring.color
           << "\", fillcolor=\"" << display_color(v.coloring.color) << "\"];\n";
    }
    for (int u = 0; u < g.n; u++)
        for (int v : g.adj[u])
            if (u < v) os << "    " << u << " -- " << v << ";\n";
    os << "}\n";
}

void write_coloring_dot(const std::string& path, const Graph& g, const std::vector<Vertex>& vertices) {
    errno = 0;
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Cannot write file: " + path + os_cause());
    write_coloring_dot(out, g, vertices);
    out.flush();
    if (!out) throw std::runtime_error("Cannot write file: " + path + os_cause());
}
