#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <stdexcept>
#include <iomanip>
#include <omp.h>
#include <algorithm>
#include <cmath>

#include "network_io.hpp"
#include "pair_classifier.hpp"
#include "pair_classifier_parallel.hpp"
#include "protein_network_analyzer.hpp"

namespace {

// Timing of the measured runs, in milliseconds.
struct RunStats {
    double mean = 0.0;
    double fastest = 0.0;
    double slowest = 0.0;
    double spread = 0.0;  // sample standard deviation, 0 for a single run
};

RunStats summarize_runs(const std::vector<double>& durations_ms)
{
    RunStats stats;
    stats.fastest = durations_ms.front();
    stats.slowest = durations_ms.front();
    for (double d : durations_ms) {
        stats.mean += d / durations_ms.size();
        stats.fastest = std::min(stats.fastest, d);
        stats.slowest = std::max(stats.slowest, d);
    }
    if (durations_ms.size() > 1) {
        double sq_sum = 0.0;
        for (double d : durations_ms) {
            sq_sum += (d - stats.mean) * (d - stats.mean);
        }
        stats.spread = std::sqrt(sq_sum / (durations_ms.size() - 1));
    }
    return stats;
}

} // namespace


// Times the join + classification stage (all three pair categories) for one
// classifier implementation. Pair universe, canonical edges and connectivity
// groups are prepared once outside the timed region.
int main(int argc, char* argv[]) {
    if (argc < 6) {
        std::cerr << "Usage: " << argv[0] << " <implementation_type> <proteins_file> <compartments_file> <interactions_file> <num_runs> [num_threads]" << std::endl;
        std::cerr << "  implementation_type: serial, parallel" << std::endl;
        std::cerr << "  num_runs: Number of times to run join + classify for timing." << std::endl;
        std::cerr << "  num_threads (optional): Number of threads for the parallel version (default: max available)." << std::endl;
        return 1;
    }

    std::string impl_type = argv[1];
    NetworkInput input;
    int num_runs = 0;
    int num_threads = omp_get_max_threads(); // Default to max threads

    try {
        num_runs = std::stoi(argv[5]);
        if (argc > 6) {
            num_threads = std::stoi(argv[6]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric argument: " << e.what() << std::endl;
        return 1;
    }

    if (num_threads <= 0) {
        std::cerr << "Warning: Invalid number of threads specified (" << num_threads << "). Using default (" << omp_get_max_threads() << ")." << std::endl;
        num_threads = omp_get_max_threads();
    }

    if (num_runs <= 0) {
        std::cerr << "Error: Number of runs must be positive." << std::endl;
        return 1;
    }

    ExecutionMode mode = ExecutionMode::SERIAL;
    if (!parseExecutionMode(impl_type, mode)) {
        std::cerr << "Error: Unknown implementation type '" << impl_type << "'." << std::endl;
        std::cerr << "Supported types: serial, parallel" << std::endl;
        return 1;
    }

    // --- Load Inputs ---
    if (!load_proteins(argv[2], input.proteins) ||
        !load_compartments(argv[3], input.compartments) ||
        !load_interactions(argv[4], input.interactions)) {
        return 1; // Error loading data
    }

    // --- Configure OpenMP ---
    if (mode == ExecutionMode::PARALLEL) {
        omp_set_num_threads(num_threads);
        std::cout << "Using OpenMP with " << num_threads << " threads." << std::endl;
    } else {
        num_threads = 1; // Serial runs on 1 thread
        std::cout << "Running serial implementation (1 thread)." << std::endl;
    }

    const PairCategory categories[] = {
        PairCategory::UNOBSERVED,
        PairCategory::UNOBSERVED_CROSS_COMPARTMENT,
        PairCategory::CROSS_GROUP_CROSS_COMPARTMENT,
    };

    std::vector<double> durations; // Store durations in milliseconds
    durations.reserve(num_runs);
    size_t n_pairs = 0;

    try {
        // Pipeline stages that are not being timed.
        ProteinNetworkAnalyzer prepared(input, ExecutionMode::SERIAL);
        n_pairs = prepared.allPairs().size();

        std::cout << "\nStarting benchmark..." << std::endl;
        std::cout << "Implementation: " << impl_type << std::endl;
        std::cout << "Protein Count:  " << prepared.proteins().size() << std::endl;
        std::cout << "Pair Count:     " << n_pairs << std::endl;
        std::cout << "Number of Runs: " << num_runs << std::endl;
        std::cout << "Threads:        " << num_threads << std::endl;

        auto run_benchmark = [&](const auto& classifier) {
            size_t selected_total = 0;

            // Warm-up run
            {
                std::cout << "Performing warm-up run..." << std::endl;
                std::vector<JoinedPair> table = classifier.join(prepared.allPairs(), input.compartments, prepared.groupIdMap());
                for (PairCategory category : categories) {
                    selected_total += classifier.classify(table, category).size();
                }
                std::cout << "Warm-up complete." << std::endl;
            }

            // Timed runs
            for (int i = 0; i < num_runs; ++i) {
                auto start_time = std::chrono::high_resolution_clock::now();

                std::vector<JoinedPair> table = classifier.join(prepared.allPairs(), input.compartments, prepared.groupIdMap());
                size_t selected_run = 0;
                for (PairCategory category : categories) {
                    selected_run += classifier.classify(table, category).size();
                }

                auto end_time = std::chrono::high_resolution_clock::now();

                std::chrono::duration<double, std::milli> duration_ms = end_time - start_time;
                durations.push_back(duration_ms.count());
                std::cout << "Run " << (i + 1) << ": " << duration_ms.count() << " ms (" << selected_run << " rows selected)" << std::endl;

                if (selected_run != selected_total) {
                    std::cerr << "Warning: Run " << (i + 1) << " selected " << selected_run
                              << " rows, warm-up selected " << selected_total << "." << std::endl;
                }
            }
        };

        if (mode == ExecutionMode::SERIAL) {
            PairClassifier classifier(prepared.knownInteractions());
            run_benchmark(classifier);
        } else {
            PairClassifierParallel classifier(prepared.knownInteractions());
            run_benchmark(classifier);
        }
    } catch (const std::exception& e) {
        std::cerr << "An exception occurred during benchmarking: " << e.what() << std::endl;
        return 1;
    }

    if (durations.empty()) {
        std::cerr << "Error: No benchmark runs were completed successfully." << std::endl;
        return 1;
    }

    RunStats stats = summarize_runs(durations);
    // Pairs joined and classified per millisecond on the mean run.
    double throughput = stats.mean > 0.0 ? n_pairs / stats.mean : 0.0;

    std::cout << "\n--- Classification Timing ---" << std::endl;
    std::cout << std::fixed << std::setprecision(4);
    std::cout << impl_type << " on " << num_threads << " thread(s), " << n_pairs << " pairs, "
              << num_runs << " runs" << std::endl;
    std::cout << "  mean " << stats.mean << " ms, fastest " << stats.fastest << " ms, slowest "
              << stats.slowest << " ms, stddev " << stats.spread << " ms" << std::endl;
    std::cout << "  " << throughput << " pairs/ms" << std::endl;

    return 0;
}
