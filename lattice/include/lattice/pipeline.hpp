#ifndef LATTICE_PIPELINE_HPP
#define LATTICE_PIPELINE_HPP

#include <lattice/options.hpp>
#include <lattice/snapshot.hpp>
#include <lattice/word_list.hpp>
#include <string>
#include <vector>

namespace lattice {

struct PipelineStats {
    std::size_t input_records = 0;
    std::size_t accepted_words = 0;
    std::size_t rejected_records = 0;
    std::size_t duplicate_records = 0;
    std::size_t raw_nodes = 0;
    std::size_t raw_edges = 0;
    std::size_t minimized_nodes = 0;
    std::size_t minimized_edges = 0;
    std::size_t merges = 0;
    bool verified = false;
};

struct PipelineResult {
    GraphSnapshot snapshot;    // full export, round-trips to the accepted words
    GraphSnapshot display;     // snapshot cut to Options::max_export_nodes (same as snapshot when unlimited)
    WordListReport input;
    PipelineStats stats;
};

/**
 * Construction pipeline: prepare words -> build trie -> minimize ->
 * integrity gate -> export. Stages run strictly in sequence on the calling
 * thread.
 */
class Pipeline {
private:
    Options options_;

public:
    explicit Pipeline(Options options = Options());

    const Options& options() const { return options_; }

    /**
     * Throws MalformedInput (fail_fast only), LatticeError when no record
     * survives preparation, and IntegrityViolation when the minimized graph
     * does not encode the accepted words. Nothing is exported after a failed
     * integrity check.
     */
    PipelineResult run(const std::vector<std::string>& records) const;

    static std::string summary(const PipelineStats& stats);
};

} // namespace lattice

#endif // LATTICE_PIPELINE_HPP
