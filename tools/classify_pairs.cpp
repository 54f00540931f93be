#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <omp.h>       // For omp_set_num_threads and omp_get_max_threads

#include "network_io.hpp"
#include "pair_classifier.hpp"
#include "protein_network_analyzer.hpp"

// Classifies every protein pair of one dataset and writes the three pair
// tables as CSV files into <output_dir>.
int main(int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: " << argv[0] << " <proteins_file> <compartments_file> <interactions_file> <output_dir> [mode] [num_threads]" << std::endl;
        std::cerr << "  proteins_file: One protein identifier per line." << std::endl;
        std::cerr << "  compartments_file: CSV with header protein_id,compartment_id." << std::endl;
        std::cerr << "  interactions_file: One 'protein_A protein_B' interaction per line." << std::endl;
        std::cerr << "  mode (optional): serial or parallel (default: serial)." << std::endl;
        std::cerr << "  num_threads (optional): Number of threads for parallel mode (default: max available)." << std::endl;
        return 1;
    }

    const std::string proteins_file = argv[1];
    const std::string compartments_file = argv[2];
    const std::string interactions_file = argv[3];
    const std::string output_dir = argv[4];

    ExecutionMode mode = ExecutionMode::SERIAL;
    if (argc > 5 && !parseExecutionMode(argv[5], mode)) {
        std::cerr << "Error: Unknown mode '" << argv[5] << "'. Supported modes: serial, parallel" << std::endl;
        return 1;
    }

    int num_threads = omp_get_max_threads();
    if (argc > 6) {
        try {
            num_threads = std::stoi(argv[6]);
        } catch (const std::exception&) {
            num_threads = 0;
        }
        if (num_threads <= 0) {
            std::cerr << "Warning: Invalid number of threads specified (" << argv[6] << "). Using default (" << omp_get_max_threads() << ")." << std::endl;
            num_threads = omp_get_max_threads();
        }
    }

    // --- Load Inputs ---
    NetworkInput input;
    if (!load_proteins(proteins_file, input.proteins) ||
        !load_compartments(compartments_file, input.compartments) ||
        !load_interactions(interactions_file, input.interactions)) {
        return 1;
    }

    if (mode == ExecutionMode::PARALLEL) {
        omp_set_num_threads(num_threads);
        std::cout << "Using OpenMP with " << num_threads << " threads." << std::endl;
    } else {
        std::cout << "Running serial classification (1 thread)." << std::endl;
    }

    // --- Classify ---
    try {
        ProteinNetworkAnalyzer analyzer(input, mode);

        std::cout << "\n--- Network Summary ---" << std::endl;
        std::cout << "Proteins:             " << analyzer.proteins().size() << std::endl;
        std::cout << "Known interactions:   " << analyzer.knownInteractions().size() << " distinct ("
                  << analyzer.canonicalInteractions().size() << " listed)" << std::endl;
        std::cout << "Connectivity groups:  " << analyzer.connectedGroups().size() << std::endl;
        std::cout << "Pair universe:        " << analyzer.allPairs().size() << std::endl;

        const PairCategory categories[] = {
            PairCategory::UNOBSERVED,
            PairCategory::UNOBSERVED_CROSS_COMPARTMENT,
            PairCategory::CROSS_GROUP_CROSS_COMPARTMENT,
        };

        bool all_written = true;
        for (PairCategory category : categories) {
            std::vector<JoinedPair> rows = analyzer.select(category);
            std::cout << categoryName(category) << ": " << rows.size() << " pairs" << std::endl;

            std::string path = output_dir + "/" + categoryName(category) + ".csv";
            if (!write_pair_table(path, rows)) {
                all_written = false;
            }
        }

        if (!all_written) {
            std::cerr << "Error: Some output tables could not be written." << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Classification failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
