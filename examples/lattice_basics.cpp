/**
 * Basic Lattice Usage Example
 *
 * Demonstrates the construction pipeline and traversal:
 * - Building and minimizing a small dictionary
 * - Inspecting the exported node/edge snapshot
 * - Prefix, suffix and word queries on a shared node
 */

#include <lattice/pipeline.hpp>
#include <lattice/snapshot_io.hpp>
#include <lattice/traversal.hpp>
#include <lattice/errors.hpp>
#include <iostream>

using namespace lattice;

namespace {

void print_paths(const char* title, const PathSet& set) {
    std::cout << "  " << title << ": {";
    for (std::size_t i = 0; i < set.paths.size(); ++i) {
        std::cout << "\"" << set.paths[i] << "\"";
        if (i < set.paths.size() - 1) std::cout << ", ";
    }
    std::cout << "}" << (set.truncated ? " (truncated)" : "") << "\n";
}

} // namespace

int main() {
    std::cout << "=== Basic Lattice Usage Example ===\n\n";

    std::vector<std::string> records = {"Cats", "rats", "bats", "cat", "cap", "rat", "", "bats"};

    Pipeline pipeline;
    PipelineResult result;
    try {
        result = pipeline.run(records);
    } catch (const LatticeError& e) {
        std::cerr << "Pipeline failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << Pipeline::summary(result.stats) << "\n\n";
    for (const auto& rejected : result.input.rejected) {
        std::cout << "Rejected record " << rejected.index << ": " << rejected.reason << "\n";
    }
    std::cout << "\n";

    std::cout << "Snapshot nodes:\n";
    for (const auto& n : result.snapshot.nodes) {
        std::cout << "  " << n.id << " " << n.label() << " (level " << n.level << ")\n";
    }
    std::cout << "Snapshot edges:\n";
    for (const auto& e : result.snapshot.edges) {
        std::cout << "  " << e.source << " -> " << e.target << " [" << e.label << "]\n";
    }
    std::cout << "\n";

    SnapshotIndex index(result.snapshot, pipeline.options().max_traversal_results);
    print_paths("All words", index.words());

    // Nodes reached along more than one path are shared suffixes
    for (const auto& n : result.snapshot.nodes) {
        if (n.kind != NodeKind::Symbol || index.prefixes(n.id).size() < 2) continue;
        std::cout << "\nNode " << n.id << " '" << n.label() << "':\n";
        print_paths("Prefixes", index.prefixes(n.id));
        print_paths("Suffixes", index.suffixes(n.id));
        print_paths("Words", index.words_through(n.id));
    }

    std::vector<uint8_t> bytes = encode_snapshot(result.snapshot);
    std::cout << "\nWXF snapshot: " << bytes.size() << " bytes\n";
    return 0;
}
