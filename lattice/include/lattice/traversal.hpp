#ifndef LATTICE_TRAVERSAL_HPP
#define LATTICE_TRAVERSAL_HPP

#include <lattice/snapshot.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace lattice {

/**
 * Strings produced by one enumeration. `truncated` is set when the advisory
 * result cap stopped the walk early.
 */
struct PathSet {
    std::vector<std::string> paths;
    bool truncated = false;

    std::size_t size() const { return paths.size(); }
    bool empty() const { return paths.empty(); }
};

/**
 * Read-only adjacency index over a snapshot.
 *
 * Every query is const and touches no shared mutable state, so one index can
 * serve any number of threads. Walks use explicit stacks; they terminate
 * because an exported lattice is acyclic. A `max_results` of zero falls back
 * to the index-wide cap given at construction (Options::max_traversal_results),
 * and a zero cap there means unlimited.
 *
 * Queries take the pivot's snapshot id and throw UnreachableNodeReference
 * for an id the snapshot does not contain.
 */
class SnapshotIndex {
private:
    GraphSnapshot snapshot_;
    std::unordered_map<NodeId, std::size_t> position_;   // node id -> index in snapshot_.nodes
    std::vector<std::vector<std::size_t>> outgoing_;     // by node index
    std::vector<std::vector<std::size_t>> incoming_;
    std::size_t root_ = 0;
    std::size_t max_results_;

    std::size_t index_of(NodeId id) const;
    std::size_t cap(std::size_t max_results) const { return max_results ? max_results : max_results_; }
    std::vector<NodeId> reach(NodeId id, const std::vector<std::vector<std::size_t>>& adjacency) const;

public:
    // Validates the snapshot (SnapshotFormatError on a malformed one)
    explicit SnapshotIndex(GraphSnapshot snapshot, std::size_t max_results = 0);

    const GraphSnapshot& snapshot() const { return snapshot_; }
    const SnapshotNode& node(NodeId id) const;
    NodeId root_id() const { return snapshot_.nodes[root_].id; }
    std::size_t max_results() const { return max_results_; }

    /**
     * Strings along every ROOT -> pivot path. The pivot's own character ends
     * each string; ROOT and END contribute nothing. prefixes(ROOT) == {""},
     * and a direct child of ROOT has the single prefix of its own character.
     * Viewers that strip the pivot from prefixes must drop the last character.
     */
    PathSet prefixes(NodeId id, std::size_t max_results = 0) const;

    // Strings along every pivot -> END path, pivot excluded. suffixes(END) == {""}.
    PathSet suffixes(NodeId id, std::size_t max_results = 0) const;

    // Every prefix joined with every suffix: the dictionary words through the pivot
    PathSet words_through(NodeId id, std::size_t max_results = 0) const;

    // All words encoded by the snapshot (words_through ROOT)
    PathSet words(std::size_t max_results = 0) const { return words_through(root_id(), max_results); }

    // Ids of every node that reaches the pivot / is reached from it, BFS order, pivot excluded
    std::vector<NodeId> ancestors(NodeId id) const;
    std::vector<NodeId> descendants(NodeId id) const;
};

} // namespace lattice

#endif // LATTICE_TRAVERSAL_HPP
