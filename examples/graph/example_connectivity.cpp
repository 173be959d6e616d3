// examples/graph/example_connectivity.cpp - Network resilience
//
// Build a minimum spanning tree over an undirected link graph and find
// the links (bridges) and sites (articulation points) whose loss would
// split the network.
//
// Usage:
//   example_connectivity [edges.csv]
//     CSV rows are u,v,weight with an optional header.  Without a file
//     a built-in topology is used: a triangle 0-1-2 with a tail 2-3-4.
//
// Compile (needs nlohmann_json on the include path):
//   g++ -std=c++20 -O2 -I include -o example_connectivity examples/graph/example_connectivity.cpp

#include <gtopo/graph/graph.h>
#include <gtopo/graph/graph_io.h>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace gtopo::graph;

connectivity_graph make_links() {
    return make_connectivity_graph({
        {0, 1, 1.0},
        {1, 2, 2.0},
        {0, 2, 3.0},
        {2, 3, 4.0},
        {3, 4, 1.5},
    });
}

int main(int argc, char** argv) {
    try {
        connectivity_graph g;
        if (argc > 1) {
            std::ifstream in(argv[1]);
            if (!in) {
                std::cerr << "Error: cannot open " << argv[1] << '\n';
                return to_int(exit_status::invalid_input);
            }
            g = io::read_connectivity_csv(in);
        } else {
            g = make_links();
        }

        std::cout << "Nodes: " << g.node_count()
                  << "  Links: " << g.edge_count() << "\n\n";

        auto const report = analyze_connectivity(g);
        io::write(std::cout, g, report);

        auto const cc = connected_components(g);
        std::cout << "\nConnected components: " << cc.component_count << '\n';

        std::cout << "\nAs JSON:\n";
        io::write_json(std::cout, g, report);
        return to_int(exit_status::success);
    } catch (graph_error const& e) {
        std::cerr << "Error (" << to_string(e.kind()) << "): " << e.what() << '\n';
        return to_int(exit_status::invalid_input);
    } catch (std::exception const& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return to_int(exit_status::invalid_input);
    }
}
