#include <lattice/pipeline.hpp>
#include <lattice/errors.hpp>
#include <lattice/debug_log.hpp>
#include <lattice/exporter.hpp>
#include <lattice/integrity.hpp>
#include <lattice/minimizer.hpp>
#include <lattice/trie_builder.hpp>
#include <sstream>

namespace lattice {

Pipeline::Pipeline(Options options)
    : options_(std::move(options)) {
    DEBUG_LOG("Pipeline created: %s", options_.to_string().c_str());
}

PipelineResult Pipeline::run(const std::vector<std::string>& records) const {
    PipelineResult result;
    PipelineStats& stats = result.stats;
    stats.input_records = records.size();

    result.input = prepare_words(records, options_);
    stats.accepted_words = result.input.words.size();
    stats.rejected_records = result.input.rejected.size();
    stats.duplicate_records = result.input.duplicates;
    if (result.input.words.empty()) {
        throw LatticeError("No valid words among " + std::to_string(records.size()) + " records");
    }

    Lattice raw = TrieBuilder::build(result.input.words);
    stats.raw_nodes = raw.node_count();
    stats.raw_edges = raw.edge_count();

    Minimizer minimizer;
    Lattice minimized = minimizer.minimize(raw);
    stats.minimized_nodes = minimized.node_count();
    stats.minimized_edges = minimized.edge_count();
    stats.merges = minimizer.last_stats().merges;

    if (options_.verify) {
        IntegrityChecker::enforce(minimized, result.input.words);
        stats.verified = true;
    } else {
        DEBUG_LOG("Integrity gate disabled, exporting unverified lattice");
    }

    result.snapshot = export_snapshot(minimized);
    if (options_.max_export_nodes > 0) {
        result.display = result.snapshot.truncated_to(options_.max_export_nodes);
    } else {
        result.display = result.snapshot;
    }

    DEBUG_LOG("%s", summary(stats).c_str());
    return result;
}

std::string Pipeline::summary(const PipelineStats& stats) {
    std::ostringstream oss;
    oss << "=== Lattice Summary ===\n";
    oss << "Records: " << stats.input_records
        << " (accepted " << stats.accepted_words
        << ", rejected " << stats.rejected_records
        << ", duplicate " << stats.duplicate_records << ")\n";
    oss << "Raw trie: " << stats.raw_nodes << " nodes, " << stats.raw_edges << " edges\n";
    oss << "Minimized: " << stats.minimized_nodes << " nodes, " << stats.minimized_edges << " edges"
        << " (" << stats.merges << " merges)\n";
    if (stats.raw_nodes > 0) {
        double ratio = static_cast<double>(stats.minimized_nodes) / static_cast<double>(stats.raw_nodes);
        oss << "Node ratio: " << ratio << "\n";
    }
    oss << "Integrity: " << (stats.verified ? "verified" : "not checked");
    return oss.str();
}

} // namespace lattice
