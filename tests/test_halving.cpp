#include "errors.hpp"
#include "generate.hpp"
#include "simulator.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <vector>

namespace {
void expect_halving_bound(const Topology& t) {
    expect_proper_coloring(t.graph, t.vertices);
    for (auto& v : t.vertices) {
        EXPECT_LE(v.coloring.color, t.delta + 1) << "node " << v.id;
        EXPECT_TRUE(v.coloring.is_permanent());
    }
}
}  // namespace

TEST(HalvingPolicyTest, complete_graph_of_four_gets_distinct_small_colors) {
    Topology t = make_named_topology("complete", 4);
    HalvingPolicy policy;
    auto res = run_simulation(t.graph, t.vertices, policy);

    EXPECT_TRUE(res.converged);
    EXPECT_EQ(policy.target(), 4);
    EXPECT_EQ(distinct_colors(t.vertices).size(), 4u);
    EXPECT_LE(*std::max_element(res.color.begin(), res.color.end()), 4);
}

TEST(HalvingPolicyTest, initial_colors_are_half_the_identity) {
    Topology t = make_named_topology("chain", 6);
    HalvingPolicy policy;
    policy.initialize(t.graph, t.vertices);
    EXPECT_EQ(colors_of(t.vertices), (std::vector<int>{0, 1, 1, 2, 2, 3}));
}

TEST(HalvingPolicyTest, named_topologies_converge_below_target) {
    for (const char* shape : {"complete", "chain", "hydrocarbon"}) {
        for (int n = 1; n <= 40; n++) {
            Topology t = make_named_topology(shape, n);
            HalvingPolicy policy;
            run_simulation(t.graph, t.vertices, policy);
            expect_halving_bound(t);
        }
    }
}

TEST(HalvingPolicyTest, long_chain_shrinks_large_identities) {
    Topology t = make_named_topology("chain", 500);
    HalvingPolicy policy;
    auto res = run_simulation(t.graph, t.vertices, policy);
    expect_halving_bound(t);
    EXPECT_LE(*std::max_element(res.color.begin(), res.color.end()), 3);
}

TEST(HalvingPolicyTest, random_graphs_converge_below_target) {
    for (uint64_t seed = 0; seed < 10; seed++) {
        for (double p : {0.1, 0.4}) {
            Topology t = make_topology(make_random_gnp(30, p, seed));
            HalvingPolicy policy;
            run_simulation(t.graph, t.vertices, policy);
            expect_halving_bound(t);
        }
    }
}

TEST(HalvingPolicyTest, colors_only_shrink_or_take_a_first_fit_slot) {
    Topology t = make_named_topology("hydrocarbon", 60);
    HalvingPolicy policy;
    std::vector<int> previous;

    SimulationOptions opt;
    opt.on_round = [&](const RoundStats&, const std::vector<Vertex>& vertices) {
        auto now = colors_of(vertices);
        if (!previous.empty()) {
            for (auto& v : vertices) {
                int before = previous[v.id];
                int after = now[v.id];
                EXPECT_TRUE(after <= before || after <= t.graph.degree(v.id))
                    << "node " << v.id << " went from " << before << " to " << after;
            }
        }
        previous = now;
    };
    policy.initialize(t.graph, t.vertices);
    previous = colors_of(t.vertices);
    run_simulation(t.graph, t.vertices, policy, opt);
    expect_halving_bound(t);
}

TEST(HalvingPolicyTest, highest_identity_resolves_a_clash) {
    Topology t = make_named_topology("complete", 4);
    HalvingPolicy policy;
    policy.initialize(t.graph, t.vertices);

    Vertex high(3);
    high.coloring = Coloring::candidate(1);
    high.inbox = {Message{0, Coloring::candidate(0)}, Message{1, Coloring::candidate(1)},
                  Message{2, Coloring::candidate(2)}};
    EXPECT_EQ(policy.update(high, 1), Coloring::candidate(3));

    Vertex low(1);
    low.coloring = Coloring::candidate(1);
    low.inbox = {Message{0, Coloring::candidate(0)}, Message{2, Coloring::candidate(2)},
                 Message{3, Coloring::candidate(1)}};
    EXPECT_EQ(policy.update(low, 1), Coloring::candidate(1));
}

TEST(HalvingPolicyTest, first_fit_takes_smallest_gap) {
    Topology t = make_named_topology("complete", 5);
    HalvingPolicy policy;
    policy.initialize(t.graph, t.vertices);

    Vertex v(4);
    v.coloring = Coloring::candidate(3);
    v.inbox = {Message{0, Coloring::candidate(3)}, Message{1, Coloring::candidate(0)},
               Message{2, Coloring::candidate(2)}, Message{3, Coloring::candidate(0)}};
    EXPECT_EQ(policy.update(v, 1), Coloring::candidate(1));
}

TEST(HalvingPolicyTest, conflict_free_vertex_halves_until_target) {
    Topology t = make_named_topology("chain", 3);
    HalvingPolicy policy;
    policy.initialize(t.graph, t.vertices);
    ASSERT_EQ(policy.target(), 3);

    Vertex v(1);
    v.coloring = Coloring::candidate(20);
    v.inbox = {Message{0, Coloring::candidate(0)}, Message{2, Coloring::candidate(1)}};
    EXPECT_EQ(policy.update(v, 1), Coloring::candidate(10));

    v.coloring = Coloring::candidate(3);
    EXPECT_EQ(policy.update(v, 1), Coloring::candidate(3));
}

TEST(HalvingPolicyTest, isolated_vertex_keeps_color_zero) {
    Topology t = make_topology(Graph(1));
    HalvingPolicy policy;
    auto res = run_simulation(t.graph, t.vertices, policy);
    EXPECT_EQ(res.rounds, 1);
    EXPECT_EQ(t.vertices[0].coloring, Coloring::permanent(0));
}

TEST(HalvingPolicyTest, converged_state_is_a_fixed_point) {
    Topology t = make_named_topology("complete", 12);
    HalvingPolicy policy;
    run_simulation(t.graph, t.vertices, policy);

    auto before = colors_of(t.vertices);
    deliver_phase(t.graph, t.vertices);
    compute_phase(t.vertices, policy, 1000);
    EXPECT_EQ(colors_of(t.vertices), before);
}

TEST(HalvingPolicyTest, rejects_empty_graph) {
    Graph g;
    std::vector<Vertex> vertices;
    HalvingPolicy policy;
    EXPECT_THROW(run_simulation(g, vertices, policy), ConfigurationError);
}
