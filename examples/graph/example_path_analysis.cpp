// examples/graph/example_path_analysis.cpp - Service latency analysis
//
// A small microservice topology: requests enter at api and must reach
// db.  Edge weights are call latencies in milliseconds.  The example
// finds the fastest route and its bottleneck, checks it against a
// latency SLO, then simulates a cache upgrade plus an auth outage.
//
// Usage:
//   example_path_analysis [graph.json] [overrides] [drops]
//     graph.json: {"nodes": [...], "edges": [{"from", "to", "latency_ms"}]}
//                 ("-" or absent: the built-in topology below)
//     overrides:  "from:to:weight,..."   (default "cache:db:1")
//     drops:      "from:to,..."          (default "api:auth")
//
// A loaded graph must contain api and db.
//
// Compile (needs nlohmann_json on the include path):
//   g++ -std=c++20 -O2 -I include -o example_path_analysis examples/graph/example_path_analysis.cpp

#include <gtopo/graph/graph.h>
#include <gtopo/graph/graph_io.h>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gtopo::graph;

// =========================================================================
// Service topology
// =========================================================================
//
//   api → auth  (5ms)      auth → db   (3ms)
//   api → cache (2ms)      cache → db  (10ms)

service_graph make_services() {
    return make_service_graph(
        {"api", "auth", "db", "cache"},
        {{"api", "auth", 5.0},
         {"auth", "db", 3.0},
         {"api", "cache", 2.0},
         {"cache", "db", 10.0}});
}

int main(int argc, char** argv) {
    try {
        service_graph g;
        if (argc > 1 && std::string(argv[1]) != "-") {
            std::ifstream in(argv[1]);
            if (!in) {
                std::cerr << "Error: cannot open " << argv[1] << '\n';
                return to_int(exit_status::invalid_input);
            }
            g = io::read_service_json(in);
        } else {
            g = make_services();
        }
        std::cout << "Services: " << g.node_count()
                  << "  Dependencies: " << g.edge_count() << "\n\n";

        // --- Fastest route ---
        auto const path = shortest_path(g, "api", "db");
        io::write(std::cout, g, path);
        std::cout << '\n';

        // --- SLO: 8ms budget is met exactly, 7ms is not ---
        for (double budget : {8.0, 7.0}) {
            auto const slo = check_slo(g, "api", "db", budget);
            io::write(std::cout, g, slo);
            std::cout << "  (exit status " << to_int(exit_status_for(slo)) << ")\n\n";
        }

        // --- What-if ---
        std::string const override_spec = argc > 2 ? argv[2] : "cache:db:1";
        std::string const drop_spec = argc > 3 ? argv[3] : "api:auth";
        auto const overrides = io::parse_overrides(override_spec);
        auto const drops = io::parse_drops(drop_spec);

        auto const sim = simulate(g, "api", "db", overrides, drops);
        io::write(std::cout, g, sim);

        std::cout << "\nAs JSON:\n";
        io::write_json(std::cout, g, sim);
        return to_int(exit_status_for(sim));
    } catch (graph_error const& e) {
        std::cerr << "Error (" << to_string(e.kind()) << "): " << e.what() << '\n';
        return to_int(exit_status::invalid_input);
    } catch (std::exception const& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return to_int(exit_status::invalid_input);
    }
}
