#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <set>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <omp.h>   // For omp_set_num_threads

#include "network_io.hpp"
#include "pair_classifier.hpp"
#include "pair_classifier_parallel.hpp"
#include "protein_network_analyzer.hpp"

namespace {

bool load_network(const std::string& resource_dir, NetworkInput& input) {
    return load_proteins(resource_dir + "/proteins.txt", input.proteins) &&
           load_compartments(resource_dir + "/protein_compartments.csv", input.compartments) &&
           load_interactions(resource_dir + "/protein_interactions.txt", input.interactions);
}

// Reports the first few row mismatches between two tables.
bool compare_tables(const std::string& label, const std::vector<JoinedPair>& serial, const std::vector<JoinedPair>& parallel) {
    if (serial.size() != parallel.size()) {
        std::cerr << label << ": Row Count Mismatch! Serial: " << serial.size() << ", Parallel: " << parallel.size() << std::endl;
        return false;
    }

    long long mismatches = 0;
    const int report_limit = 10;
    for (size_t i = 0; i < serial.size(); ++i) {
        if (serial[i] != parallel[i]) {
            mismatches++;
            if (mismatches <= report_limit) {
                std::cerr << label << ": Mismatch at row " << i << ": serial (" << serial[i].protein_A << ", " << serial[i].protein_B
                          << "), parallel (" << parallel[i].protein_A << ", " << parallel[i].protein_B << ")" << std::endl;
            }
        }
    }

    if (mismatches > 0) {
        std::cout << label << ": FAIL - " << mismatches << " mismatching rows." << std::endl;
        return false;
    }
    std::cout << label << ": PASS - " << serial.size() << " rows match." << std::endl;
    return true;
}

bool is_subset(const std::vector<JoinedPair>& inner, const std::vector<JoinedPair>& outer) {
    std::set<ProteinPair> outer_set;
    for (const auto& row : outer) {
        outer_set.insert(ProteinPair(row.protein_A, row.protein_B));
    }
    for (const auto& row : inner) {
        if (outer_set.count(ProteinPair(row.protein_A, row.protein_B)) == 0) {
            return false;
        }
    }
    return true;
}

// Independent BFS over an adjacency list; two proteins are connected iff
// reachable. Used to verify the union-find partition.
std::unordered_map<std::string, int> bfs_components(const std::vector<ProteinPair>& edges) {
    std::unordered_map<std::string, std::vector<std::string>> graph;
    for (const auto& e : edges) {
        graph[e.first].push_back(e.second);
        graph[e.second].push_back(e.first);
    }

    std::unordered_map<std::string, int> component;
    int next_id = 0;
    for (const auto& kv : graph) {
        if (component.count(kv.first)) continue;

        std::queue<std::string> q;
        q.push(kv.first);
        component[kv.first] = next_id;
        while (!q.empty()) {
            std::string x = q.front(); q.pop();
            for (const auto& v : graph.at(x)) {
                if (!component.count(v)) {
                    component[v] = next_id;
                    q.push(v);
                }
            }
        }
        next_id++;
    }
    return component;
}

// --- CONNECTIVITY TEST ---
bool run_connectivity_test(const ProteinNetworkAnalyzer& analyzer) {
    std::cout << "\n--- Testing Connectivity Groups (BFS Verification) ---" << std::endl;
    bool passed = true;

    const GroupIdMap& group_ids = analyzer.groupIdMap();
    std::unordered_map<std::string, int> expected = bfs_components(analyzer.canonicalInteractions());

    if (group_ids.size() != expected.size()) {
        std::cerr << "Group map covers " << group_ids.size() << " proteins, edge list touches " << expected.size() << std::endl;
        passed = false;
    }

    // Every edge joins proteins of one group.
    for (const auto& e : analyzer.canonicalInteractions()) {
        if (group_ids.at(e.first) != group_ids.at(e.second)) {
            std::cerr << "Edge (" << e.first << ", " << e.second << ") spans two groups." << std::endl;
            passed = false;
        }
    }

    // Same group iff same BFS component.
    std::vector<std::string> touched;
    for (const auto& kv : expected) touched.push_back(kv.first);
    long long pairs_checked = 0;
    for (size_t a = 0; a < touched.size(); ++a) {
        for (size_t b = a + 1; b < touched.size(); ++b) {
            pairs_checked++;
            bool uf_connected = group_ids.at(touched[a]) == group_ids.at(touched[b]);
            bool bfs_connected = expected.at(touched[a]) == expected.at(touched[b]);
            if (uf_connected != bfs_connected) {
                std::cerr << "Connectivity Mismatch for (" << touched[a] << ", " << touched[b] << "): union-find says "
                          << (uf_connected ? "CONNECTED" : "DISCONNECTED") << std::endl;
                passed = false;
            }
        }
    }

    // Groups are disjoint and exhaustive.
    std::unordered_set<std::string> seen;
    size_t members = 0;
    for (const auto& group : analyzer.connectedGroups()) {
        for (const auto& protein : group) {
            seen.insert(protein);
            members++;
        }
    }
    if (members != seen.size() || seen.size() != expected.size()) {
        std::cerr << "Groups overlap or omit proteins: " << members << " memberships, " << seen.size()
                  << " distinct, " << expected.size() << " expected." << std::endl;
        passed = false;
    }

    std::cout << "Checked " << pairs_checked << " protein pairs across " << analyzer.connectedGroups().size() << " groups." << std::endl;
    std::cout << "Result: " << (passed ? "PASS" : "FAIL") << std::endl;
    return passed;
}

// --- CLASSIFICATION TEST ---
// Parallel classification must reproduce the serial tables row for row.
bool run_classification_test(const NetworkInput& input) {
    std::cout << "\n--- Testing Classification: Parallel vs Serial ---" << std::endl;

    ProteinNetworkAnalyzer serial(input, ExecutionMode::SERIAL);
    ProteinNetworkAnalyzer parallel(input, ExecutionMode::PARALLEL);
    bool passed = true;

    passed &= compare_tables("joined", serial.joinedPairs(), parallel.joinedPairs());

    const PairCategory categories[] = {
        PairCategory::UNOBSERVED,
        PairCategory::UNOBSERVED_CROSS_COMPARTMENT,
        PairCategory::CROSS_GROUP_CROSS_COMPARTMENT,
    };
    for (PairCategory category : categories) {
        passed &= compare_tables(categoryName(category), serial.select(category), parallel.select(category));
    }

    std::vector<JoinedPair> unobserved = parallel.selectUnobservedInteractions();
    std::vector<JoinedPair> unobserved_cc = parallel.selectCrossCompartmentUnobservedInteractions();
    std::vector<JoinedPair> cross_group = parallel.selectCrossGroupCrossCompartmentInteractions();

    if (!is_subset(cross_group, unobserved_cc)) {
        std::cerr << "Cross-group pairs are not a subset of unobserved cross-compartment pairs." << std::endl;
        passed = false;
    }
    if (!is_subset(unobserved_cc, unobserved)) {
        std::cerr << "Unobserved cross-compartment pairs are not a subset of unobserved pairs." << std::endl;
        passed = false;
    }
    if (unobserved.size() + parallel.knownInteractions().size() < parallel.allPairs().size()) {
        std::cerr << "Unobserved pairs plus known interactions do not cover the pair universe." << std::endl;
        passed = false;
    }

    // Every pair left out of the unobserved table must be a known edge.
    std::set<ProteinPair> kept;
    for (const auto& row : unobserved) kept.insert(ProteinPair(row.protein_A, row.protein_B));
    for (const auto& pair : parallel.allPairs()) {
        if (!kept.count(pair) && !parallel.knownInteractions().contains(pair.first, pair.second)) {
            std::cerr << "Pair (" << pair.first << ", " << pair.second << ") dropped without a known edge." << std::endl;
            passed = false;
        }
    }

    ProteinNetworkAnalyzer rerun(input, ExecutionMode::PARALLEL);
    passed &= compare_tables("rerun", cross_group, rerun.selectCrossGroupCrossCompartmentInteractions());

    std::cout << "Result: " << (passed ? "PASS" : "FAIL") << std::endl;
    return passed;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <resource_dir>" << std::endl;
        std::cerr << "  resource_dir must hold proteins.txt, protein_compartments.csv, protein_interactions.txt" << std::endl;
        return 1;
    }
    const std::string resource_dir = argv[1];

    #ifdef PROTNET_DEFAULT_THREADS
        int num_threads = PROTNET_DEFAULT_THREADS;
        omp_set_num_threads(num_threads);
        std::cout << "Setting OpenMP threads for test: " << num_threads << std::endl;
    #else
        int max_threads = omp_get_max_threads();
        std::cout << "Using default OpenMP threads (Max available likely: " << max_threads << ")." << std::endl;
    #endif

    NetworkInput input;
    if (!load_network(resource_dir, input)) {
        std::cerr << "Test Setup FAILED: Could not load test data." << std::endl;
        return 1;
    }

    bool all_tests_passed = true;
    try {
        ProteinNetworkAnalyzer analyzer(input, ExecutionMode::SERIAL);
        all_tests_passed &= run_connectivity_test(analyzer);
        all_tests_passed &= run_classification_test(input);
    } catch (const std::exception& e) {
        std::cerr << "Test FAILED: An exception occurred: " << e.what() << std::endl;
        all_tests_passed = false;
    }

    std::cout << "\n========================================" << std::endl;
    if (all_tests_passed) {
        std::cout << "Overall Result: ALL PARALLEL TESTS PASSED" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } else {
        std::cout << "Overall Result: SOME PARALLEL TESTS FAILED" << std::endl;
        std::cout << "========================================" << std::endl;
        return 1;
    }
}
