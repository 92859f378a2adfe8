#ifndef LATTICE_INTEGRITY_HPP
#define LATTICE_INTEGRITY_HPP

#include <lattice/lattice.hpp>
#include <string>
#include <vector>

namespace lattice {

/**
 * Result of checking a lattice against the word set it was built from.
 * Words are spelled from node labels, the same way an exported snapshot
 * is read back.
 */
struct IntegrityReport {
    bool acyclic = true;
    std::vector<NodeId> cycle_witness;       // first node repeated at the end
    std::vector<std::string> missing_words;  // expected, not reconstructed
    std::vector<std::string> extra_words;    // reconstructed, not expected
    std::vector<NodeId> unreachable_nodes;   // arena nodes ROOT cannot reach (END excluded)
    std::size_t reconstructed_paths = 0;

    bool passed() const {
        return acyclic && missing_words.empty() && extra_words.empty() && unreachable_nodes.empty();
    }

    std::string describe() const;
};

class IntegrityChecker {
public:
    /**
     * Active-stack DFS from ROOT. Returns the first cycle found as a node
     * path whose last element repeats the first, or an empty vector.
     */
    static std::vector<NodeId> find_cycle(const Lattice& lattice);

    /**
     * Every string spelled along a ROOT -> END path. The lattice must be
     * acyclic; find_cycle is run first by verify().
     */
    static std::vector<std::string> reconstruct_words(const Lattice& lattice);

    static IntegrityReport verify(const Lattice& lattice, const std::vector<std::string>& words);

    // verify(), then throw IntegrityViolation if the report did not pass
    static void enforce(const Lattice& lattice, const std::vector<std::string>& words);
};

} // namespace lattice

#endif // LATTICE_INTEGRITY_HPP
