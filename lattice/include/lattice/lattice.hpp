#ifndef LATTICE_LATTICE_HPP
#define LATTICE_LATTICE_HPP

#include <lattice/types.hpp>
#include <string>
#include <vector>

namespace lattice {

/**
 * Arena node. Shared suffixes are several transitions holding the same NodeId;
 * nothing owns a node except the arena.
 */
struct LatticeNode {
    NodeKind kind;
    char symbol;                          // meaningful for NodeKind::Symbol only
    bool terminal;                        // has an edge into END
    std::vector<Transition> transitions;  // insertion order, one per symbol

    LatticeNode(NodeKind k, char c = '\0') : kind(k), symbol(c), terminal(false) {}

    std::string label() const { return label_of(kind, symbol); }
};

/**
 * Index-addressed graph with one ROOT and one shared END node.
 * Used both for the raw trie and for the minimized DAG.
 */
class Lattice {
private:
    std::vector<LatticeNode> nodes_;
    NodeId root_;
    NodeId end_;

    void check_node(NodeId id) const;

public:
    Lattice();

    NodeId root() const { return root_; }
    NodeId end() const { return end_; }

    const LatticeNode& node(NodeId id) const;
    std::size_t node_count() const { return nodes_.size(); }

    // Character transitions plus one edge into END per terminal node
    std::size_t edge_count() const;

    NodeId add_node(char symbol);

    // INVALID_NODE if `from` has no transition on `symbol`
    NodeId find_transition(NodeId from, char symbol) const;

    /**
     * Add `from --symbol--> to`. Throws std::invalid_argument on a duplicate
     * symbol, a self-loop, a target that is not a Symbol node, or an unknown id.
     */
    void add_transition(NodeId from, char symbol, NodeId to);

    /**
     * Point an existing transition somewhere else. Does not check that the new
     * target spells `symbol`; the integrity checker exists to catch that.
     */
    void retarget_transition(NodeId from, char symbol, NodeId to);

    // Replace all transitions of `from` at once (targets must already exist)
    void set_transitions(NodeId from, std::vector<Transition> transitions);

    void set_terminal(NodeId id, bool terminal);

    // Transition targets in order, then END if the node is terminal
    std::vector<NodeId> successors(NodeId id) const;

    std::string summary() const;
};

} // namespace lattice

#endif // LATTICE_LATTICE_HPP
