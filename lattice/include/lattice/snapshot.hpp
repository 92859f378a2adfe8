#ifndef LATTICE_SNAPSHOT_HPP
#define LATTICE_SNAPSHOT_HPP

#include <lattice/types.hpp>
#include <string>
#include <vector>

namespace lattice {

struct SnapshotNode {
    NodeId id;
    NodeKind kind;
    char symbol;           // meaningful for NodeKind::Symbol only
    std::size_t level;     // BFS distance from ROOT

    std::string label() const { return label_of(kind, symbol); }

    bool operator==(const SnapshotNode& other) const {
        return id == other.id && kind == other.kind && level == other.level &&
               (kind != NodeKind::Symbol || symbol == other.symbol);
    }
};

struct SnapshotEdge {
    NodeId source;
    NodeId target;
    std::string label;     // target's character, or "<END>"

    bool operator==(const SnapshotEdge& other) const {
        return source == other.source && target == other.target && label == other.label;
    }
};

/**
 * Immutable node/edge export of a minimized lattice, the shape consumed by
 * traversal and by external viewers.
 */
struct GraphSnapshot {
    std::vector<SnapshotNode> nodes;
    std::vector<SnapshotEdge> edges;
    bool truncated = false;   // display-only cut, does not round-trip

    // INVALID_NODE when absent
    NodeId root_id() const;
    NodeId end_id() const;

    /**
     * Keep the first `max_nodes` nodes (id order) and the edges between them.
     * Returns a copy unchanged when the snapshot is already small enough.
     */
    GraphSnapshot truncated_to(std::size_t max_nodes) const;

    /**
     * Structural checks for snapshots that did not come from export_snapshot:
     * unique ids, exactly one ROOT with no incoming edge, at most one END,
     * every edge endpoint present, and no cycles. Unless `truncated` is set,
     * END must also exist and be reachable from ROOT. Throws SnapshotFormatError.
     */
    void validate() const;

    std::string summary() const;
};

} // namespace lattice

#endif // LATTICE_SNAPSHOT_HPP
