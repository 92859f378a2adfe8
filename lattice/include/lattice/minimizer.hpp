#ifndef LATTICE_MINIMIZER_HPP
#define LATTICE_MINIMIZER_HPP

#include <lattice/lattice.hpp>
#include <string>
#include <vector>

namespace lattice {

/**
 * Canonicalization key of a node.
 * The node's own kind and symbol are part of the key because labels live on
 * nodes: merging an 'a' node with a 'b' node would change the spelled words.
 * Transitions are sorted and refer to canonical child ids.
 */
struct NodeSignature {
    NodeKind kind;
    char symbol;
    bool terminal;
    std::vector<Transition> transitions;

    bool operator==(const NodeSignature& other) const {
        return kind == other.kind && symbol == other.symbol &&
               terminal == other.terminal && transitions == other.transitions;
    }

    bool operator!=(const NodeSignature& other) const {
        return !(*this == other);
    }

    std::size_t hash() const;
    std::string to_string() const;

    // Signature of a node whose transitions already refer to canonical children
    static NodeSignature of(const LatticeNode& node);
};

struct NodeSignatureHash {
    std::size_t operator()(const NodeSignature& sig) const { return sig.hash(); }
};

struct MinimizationStats {
    std::size_t nodes_before = 0;
    std::size_t nodes_after = 0;
    std::size_t merges = 0;          // nodes folded into an existing representative
    std::size_t pruned = 0;          // unreachable nodes dropped
    std::size_t max_height = 0;
};

/**
 * Bottom-up suffix canonicalization (hash-consing).
 *
 * Nodes are visited in increasing height (longest distance to a leaf), which
 * a post-order walk computes, so every child is canonical before its parent's
 * signature is formed. The first node registered for a signature stays the
 * representative; later equal nodes are discarded and every transition into
 * them is rewired. The surviving nodes are compacted into a fresh arena in
 * BFS order from ROOT.
 */
class Minimizer {
private:
    MinimizationStats stats_;

    // Reachable nodes in post-order (children before parents); heights filled in
    std::vector<NodeId> post_order(const Lattice& lattice, std::vector<std::size_t>& height) const;

public:
    Lattice minimize(const Lattice& raw);

    const MinimizationStats& last_stats() const { return stats_; }
};

} // namespace lattice

#endif // LATTICE_MINIMIZER_HPP
