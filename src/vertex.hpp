#pragma once
#include <ostream>
#include <vector>

// Coloring status of one vertex. Permanent is absorbing.
struct Coloring {
    enum class Status { Candidate, Permanent };

    Status status = Status::Candidate;
    int color = 0;

    static Coloring candidate(int c) { return Coloring{Status::Candidate, c}; }
    static Coloring permanent(int c) { return Coloring{Status::Permanent, c}; }

    bool is_permanent() const { return status == Status::Permanent; }

    bool operator==(const Coloring& o) const { return status == o.status && color == o.color; }
    bool operator!=(const Coloring& o) const { return !(*this == o); }
};

inline std::ostream& operator<<(std::ostream& os, const Coloring& c) {
    switch (c.status) {
        case Coloring::Status::Candidate: return os << "Candidate(" << c.color << ")";
        case Coloring::Status::Permanent: return os << "Permanent(" << c.color << ")";
    }
    return os;
}

// Snapshot of a neighbor's coloring taken in the deliver phase.
struct Message {
    int sender = -1;
    Coloring coloring;
};

struct Vertex {
    int id = 0;
    Coloring coloring;
    std::vector<Message> inbox;

    Vertex() = default;
    explicit Vertex(int id_) : id(id_), coloring(Coloring::candidate(id_)) {}
};

inline std::vector<Vertex> make_vertices(int n) {
    std::vector<Vertex> out;
    out.reserve(n);
    for (int i = 0; i < n; i++) out.emplace_back(i);
    return out;
}

inline int count_candidates(const std::vector<Vertex>& vertices) {
    int c = 0;
    for (auto& v : vertices) if (!v.coloring.is_permanent()) c++;
    return c;
}

inline std::vector<int> colors_of(const std::vector<Vertex>& vertices) {
    std::vector<int> out(vertices.size());
    for (size_t i = 0; i < vertices.size(); i++) out[i] = vertices[i].coloring.color;
    return out;
}
