#include "args.hpp"
#include "graph.hpp"
#include "io.hpp"
#include "coloring.hpp"
#include "errors.hpp"
#include "generate.hpp"
#include "simulator.hpp"

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <random>
#include <iomanip>
#include <cstdint>

static void usage() {
    std::cerr <<
        "Usage:\n"
        "  roundcolor --mode selftest [--seed <s>] [--verbose 0|1]\n"
        "  roundcolor --mode complete|chain|hydrocarbon --n <n> [--policy randomized|halving]\n"
        "      [--seed <s>] [--threads <t>] [--max_rounds <r>] [--verbose 0|1] [--out <file.dot>]\n"
        "  roundcolor --mode random --n <n> --p <p> [--graph_seed <s>] [same options]\n"
        "  roundcolor --mode file --graph <file> [--one_based 0|1] [same options]\n"
        "\n"
        "  roundcolor --mode gen --topology complete|chain|hydrocarbon --n <n> --out <file>\n"
        "\n"
        "  roundcolor --mode bench --topology complete|chain|hydrocarbon --n <n> --runs <R>\n"
        "      [--policy randomized|halving] [--seed <s>] [--threads <t>] [--max_rounds <r>]\n";
}

static std::unique_ptr<ColoringPolicy> make_policy(const std::string& name, uint64_t seed) {
    if (name == "randomized") return std::make_unique<RandomizedPolicy>(seed);
    if (name == "halving") return std::make_unique<HalvingPolicy>();
    throw ConfigurationError("Unknown --policy: " + name);
}

// The only place real entropy enters a run.
static uint64_t pick_seed(int argc, char** argv) {
    std::string s = get_arg(argc, argv, "--seed", "");
    if (!s.empty()) return (uint64_t)std::stoull(s);
    std::random_device rd;
    return ((uint64_t)rd() << 32) ^ rd();
}

static SimulationOptions options_from_args(int argc, char** argv) {
    SimulationOptions opt;
    opt.max_rounds = std::stoi(get_arg(argc, argv, "--max_rounds", "10000"));
    opt.threads = std::stoi(get_arg(argc, argv, "--threads", "1"));
    if (get_arg(argc, argv, "--verbose", "0") != "0") opt.trace = &std::cout;
    return opt;
}

static void print_summary(const SimulationResult& res, const Topology& t, const ColoringPolicy& policy) {
    std::cout << "policy=" << policy.name() << " n=" << t.graph.n << " m=" << t.graph.m()
              << " delta=" << t.delta
              << " converged=" << (res.converged ? "true" : "false")
              << " rounds=" << res.rounds << " messages=" << res.messages
              << " time=" << std::setprecision(10) << res.seconds << "s\n";
}

// 200-node complete graph: every node must end with its own color.
static int run_self_test(uint64_t seed, bool verbose) {
    Topology t = make_named_topology("complete", 200);
    RandomizedPolicy policy(seed);
    SimulationOptions opt;
    if (verbose) opt.trace = &std::cout;

    auto res = run_simulation(t.graph, t.vertices, policy, opt);
    print_summary(res, t, policy);

    std::cout << "\nAlgorithm finished:\n";
    print_coloring(std::cout, t.vertices);
    std::cout << "\nSorting by color:\n";
    print_coloring(std::cout, t.vertices, true);

    check_distinct_colors(t.vertices);
    check_proper_coloring(t.graph, t.vertices);
    std::cout << "verify=OK\n";
    return 0;
}

static Topology load_topology(const std::string& mode, int argc, char** argv) {
    if (mode == "file") {
        std::string path = get_arg(argc, argv, "--graph", "");
        if (path.empty()) throw ConfigurationError("--mode file needs --graph <file>");
        bool one_based = (get_arg(argc, argv, "--one_based", "0") != "0");
        Topology t = make_topology(read_graph_edge_list(path, one_based));
        if (t.graph.n <= 0) throw ConfigurationError("graph file has no vertices: " + path);
        return t;
    }
    int n = parse_positive_int(get_arg(argc, argv, "--n", "0"), "--n");
    if (mode == "random") {
        double p = std::stod(get_arg(argc, argv, "--p", "0.1"));
        uint64_t graph_seed = (uint64_t)std::stoull(get_arg(argc, argv, "--graph_seed", "1"));
        return make_topology(make_random_gnp(n, p, graph_seed));
    }
    return make_named_topology(mode, n);
}

static int run_mode(const std::string& mode, int argc, char** argv) {
    if (mode == "selftest") {
        bool verbose = (get_arg(argc, argv, "--verbose", "0") != "0");
        return run_self_test(pick_seed(argc, argv), verbose);
    }

    if (mode == "gen") {
        std::string type = get_arg(argc, argv, "--topology", "");
        std::string out = get_arg(argc, argv, "--out", "");
        if (type.empty() || out.empty()) { usage(); return 1; }

        Topology t = make_named_topology(type, parse_positive_int(get_arg(argc, argv, "--n", "0"), "--n"));
        write_graph_edge_list(out, t.graph, false);
        std::cout << "Wrote " << out << " n=" << t.graph.n << " m=" << t.graph.m() << " delta=" << t.delta << "\n";
        return 0;
    }

    std::string policy_name = get_arg(argc, argv, "--policy", "randomized");
    SimulationOptions opt = options_from_args(argc, argv);

    if (mode == "bench") {
        std::string type = get_arg(argc, argv, "--topology", "complete");
        int n = parse_positive_int(get_arg(argc, argv, "--n", "0"), "--n");
        int runs = std::stoi(get_arg(argc, argv, "--runs", "5"));
        if (runs < 1) runs = 1;
        uint64_t seed = pick_seed(argc, argv);
        opt.trace = nullptr;

        std::cout << "run,rounds,messages,time,converged\n";
        double sum = 0.0;
        long long rounds_sum = 0;
        int ok = 0;

        for (int r = 0; r < runs; r++) {
            Topology t = make_named_topology(type, n);
            auto policy = make_policy(policy_name, seed + (uint64_t)r);
            SimulationResult rr;
            try {
                rr = run_simulation(t.graph, t.vertices, *policy, opt);
                check_proper_coloring(t.graph, t.vertices);
            } catch (const NonConvergenceError& e) {
                std::cerr << "run " << r << ": " << e.what() << "\n";
                rr.rounds = e.rounds;
            }
            std::cout << r << "," << rr.rounds << "," << rr.messages << ","
                      << std::setprecision(10) << rr.seconds << "," << (rr.converged ? 1 : 0) << "\n";
            sum += rr.seconds;
            rounds_sum += rr.rounds;
            ok += rr.converged ? 1 : 0;
        }

        std::cout << "avg," << (double)rounds_sum / runs << ",," << std::setprecision(10) << (sum / runs)
                  << ",ok=" << ok << "/" << runs << "\n";
        return 0;
    }

    Topology t = load_topology(mode, argc, argv);
    auto policy = make_policy(policy_name, pick_seed(argc, argv));
    std::cout << "Running " << mode << " with " << t.graph.n << " vertices\n";

    auto res = run_simulation(t.graph, t.vertices, *policy, opt);
    check_proper_coloring(t.graph, t.vertices);

    print_summary(res, t, *policy);
    print_coloring(std::cout, t.vertices);

    std::string out = get_arg(argc, argv, "--out", "");
    if (!out.empty()) {
        write_coloring_dot(out, t.graph, t.vertices);
        std::cout << "Wrote " << out << "\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    std::string mode = get_arg(argc, argv, "--mode", "");
    if (mode.empty()) { usage(); return 1; }

    try {
        return run_mode(mode, argc, argv);
    } catch (const InvariantViolation& e) {
        std::cerr << "Invariant violation: " << e.what() << "\n";
        return 2;
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        usage();
        return 1;
    } catch (const NonConvergenceError& e) {
        std::cerr << "Not converged: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
