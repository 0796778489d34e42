#pragma once
#include "graph.hpp"
#include "vertex.hpp"
#include <ostream>
#include <string>
#include <vector>

Graph read_graph_edge_list(const std::string& path, bool one_based = false);
void write_graph_edge_list(const std::string& path, const Graph& g, bool one_based = false);

// "node   3 has permanent color   1" per vertex, optionally sorted by color.
void print_coloring(std::ostream& os, const std::vector<Vertex>& vertices, bool by_color = false);

// Fill color used for palette index c in the DOT export.
std::string display_color(int c);

void write_coloring_dot(std::ostream& os, const Graph& g, const std::vector<Vertex>& vertices);
void write_coloring_dot(const std::string& path, const Graph& g, const std::vector<Vertex>& vertices);
