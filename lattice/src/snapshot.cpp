#include <lattice/snapshot.hpp>
#include <lattice/errors.hpp>
#include <lattice/debug_log.hpp>
#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace lattice {

NodeId GraphSnapshot::root_id() const {
    for (const auto& n : nodes) {
        if (n.kind == NodeKind::Root) return n.id;
    }
    return INVALID_NODE;
}

NodeId GraphSnapshot::end_id() const {
    for (const auto& n : nodes) {
        if (n.kind == NodeKind::End) return n.id;
    }
    return INVALID_NODE;
}

GraphSnapshot GraphSnapshot::truncated_to(std::size_t max_nodes) const {
    if (nodes.size() <= max_nodes) {
        return *this;
    }

    GraphSnapshot result;
    result.truncated = true;
    result.nodes.assign(nodes.begin(), nodes.begin() + static_cast<std::ptrdiff_t>(max_nodes));

    std::unordered_set<NodeId> kept;
    for (const auto& n : result.nodes) {
        kept.insert(n.id);
    }
    for (const auto& e : edges) {
        if (kept.count(e.source) && kept.count(e.target)) {
            result.edges.push_back(e);
        }
    }

    WARN_LOG("Graph has %zu nodes, keeping %zu after truncation to %zu",
             nodes.size(), result.nodes.size(), max_nodes);
    return result;
}

void GraphSnapshot::validate() const {
    std::unordered_set<NodeId> ids;
    std::size_t roots = 0;
    std::size_t ends = 0;
    for (const auto& n : nodes) {
        if (!ids.insert(n.id).second) {
            throw SnapshotFormatError("duplicate node id " + std::to_string(n.id));
        }
        if (n.kind == NodeKind::Root) ++roots;
        if (n.kind == NodeKind::End) ++ends;
    }
    if (roots != 1) {
        throw SnapshotFormatError("expected exactly one ROOT node, found " + std::to_string(roots));
    }
    if (ends > 1) {
        throw SnapshotFormatError("expected at most one END node, found " + std::to_string(ends));
    }
    const NodeId root = root_id();
    for (const auto& e : edges) {
        if (!ids.count(e.source) || !ids.count(e.target)) {
            throw SnapshotFormatError("edge " + std::to_string(e.source) + " -> " + std::to_string(e.target) +
                                      " references a missing node");
        }
        if (e.source == e.target) {
            throw SnapshotFormatError("self-loop on node " + std::to_string(e.source));
        }
        if (e.target == root) {
            throw SnapshotFormatError("edge " + std::to_string(e.source) + " -> ROOT");
        }
    }

    // Kahn's algorithm: traversal walks assume a DAG
    std::unordered_map<NodeId, std::size_t> in_degree;
    std::unordered_map<NodeId, std::vector<NodeId>> children;
    for (const auto& n : nodes) {
        in_degree[n.id] = 0;
    }
    for (const auto& e : edges) {
        ++in_degree[e.target];
        children[e.source].push_back(e.target);
    }
    std::vector<NodeId> ready;
    for (const auto& [id, degree] : in_degree) {
        if (degree == 0) ready.push_back(id);
    }
    std::size_t removed = 0;
    while (!ready.empty()) {
        NodeId id = ready.back();
        ready.pop_back();
        ++removed;
        for (NodeId child : children[id]) {
            if (--in_degree[child] == 0) ready.push_back(child);
        }
    }
    if (removed != nodes.size()) {
        throw SnapshotFormatError("snapshot contains a cycle");
    }

    // A display cut may drop END; a full snapshot must spell at least one word
    if (truncated) {
        return;
    }
    const NodeId end = end_id();
    if (end == INVALID_NODE) {
        throw SnapshotFormatError("snapshot has no END node");
    }
    std::unordered_set<NodeId> reached{root};
    std::vector<NodeId> frontier{root};
    while (!frontier.empty()) {
        NodeId id = frontier.back();
        frontier.pop_back();
        for (NodeId child : children[id]) {
            if (reached.insert(child).second) frontier.push_back(child);
        }
    }
    if (!reached.count(end)) {
        throw SnapshotFormatError("END is not reachable from ROOT");
    }
}

std::string GraphSnapshot::summary() const {
    std::size_t max_level = 0;
    for (const auto& n : nodes) {
        max_level = std::max(max_level, n.level);
    }
    std::ostringstream oss;
    oss << "GraphSnapshot(nodes=" << nodes.size() << ", edges=" << edges.size()
        << ", levels=" << (nodes.empty() ? 0 : max_level + 1)
        << (truncated ? ", truncated" : "") << ")";
    return oss.str();
}

} // namespace lattice
