#include <lattice/exporter.hpp>
#include <lattice/debug_log.hpp>
#include <queue>

namespace lattice {

GraphSnapshot export_snapshot(const Lattice& lattice) {
    GraphSnapshot snapshot;
    std::vector<NodeId> snapshot_id(lattice.node_count(), INVALID_NODE);

    auto discover = [&](NodeId id, std::size_t level) {
        const LatticeNode& n = lattice.node(id);
        snapshot_id[id] = snapshot.nodes.size();
        snapshot.nodes.push_back({snapshot_id[id], n.kind, n.symbol, level});
    };

    std::queue<NodeId> queue;
    discover(lattice.root(), 0);
    queue.push(lattice.root());

    while (!queue.empty()) {
        NodeId id = queue.front();
        queue.pop();
        NodeId source = snapshot_id[id];
        std::size_t level = snapshot.nodes[source].level;

        for (NodeId next : lattice.successors(id)) {
            // First discovery in BFS is the shortest distance
            if (snapshot_id[next] == INVALID_NODE) {
                discover(next, level + 1);
                queue.push(next);
            }
            const LatticeNode& target = lattice.node(next);
            snapshot.edges.push_back({source, snapshot_id[next],
                                      target.kind == NodeKind::End ? END_TRANSITION_LABEL : target.label()});
        }
    }

    DEBUG_LOG("Exported %s", snapshot.summary().c_str());
    return snapshot;
}

} // namespace lattice
