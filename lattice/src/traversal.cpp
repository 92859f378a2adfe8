#include <lattice/traversal.hpp>
#include <lattice/errors.hpp>
#include <lattice/debug_log.hpp>
#include <queue>

namespace lattice {

SnapshotIndex::SnapshotIndex(GraphSnapshot snapshot, std::size_t max_results)
    : snapshot_(std::move(snapshot))
    , max_results_(max_results) {
    snapshot_.validate();

    const std::size_t n = snapshot_.nodes.size();
    position_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        position_.emplace(snapshot_.nodes[i].id, i);
        if (snapshot_.nodes[i].kind == NodeKind::Root) {
            root_ = i;
        }
    }

    outgoing_.resize(n);
    incoming_.resize(n);
    for (const auto& e : snapshot_.edges) {
        std::size_t source = position_.at(e.source);
        std::size_t target = position_.at(e.target);
        outgoing_[source].push_back(target);
        incoming_[target].push_back(source);
    }

    DEBUG_LOG("Indexed %s", snapshot_.summary().c_str());
}

std::size_t SnapshotIndex::index_of(NodeId id) const {
    auto it = position_.find(id);
    if (it == position_.end()) {
        throw UnreachableNodeReference(id);
    }
    return it->second;
}

const SnapshotNode& SnapshotIndex::node(NodeId id) const {
    return snapshot_.nodes[index_of(id)];
}

PathSet SnapshotIndex::prefixes(NodeId id, std::size_t max_results) const {
    const std::size_t start = index_of(id);
    const SnapshotNode& pivot = snapshot_.nodes[start];
    max_results = cap(max_results);

    PathSet result;
    // (node index, spelling from that node to the pivot, reversed)
    std::vector<std::pair<std::size_t, std::string>> stack;
    stack.emplace_back(start, pivot.kind == NodeKind::Symbol ? std::string(1, pivot.symbol) : std::string());

    while (!stack.empty()) {
        auto [index, reversed] = std::move(stack.back());
        stack.pop_back();

        if (snapshot_.nodes[index].kind == NodeKind::Root) {
            if (max_results && result.paths.size() == max_results) {
                result.truncated = true;
                break;
            }
            result.paths.emplace_back(reversed.rbegin(), reversed.rend());
            continue;
        }

        const auto& parents = incoming_[index];
        for (auto it = parents.rbegin(); it != parents.rend(); ++it) {
            const SnapshotNode& parent = snapshot_.nodes[*it];
            if (parent.kind == NodeKind::Symbol) {
                stack.emplace_back(*it, reversed + parent.symbol);
            } else {
                stack.emplace_back(*it, reversed);
            }
        }
    }
    return result;
}

PathSet SnapshotIndex::suffixes(NodeId id, std::size_t max_results) const {
    const std::size_t start = index_of(id);
    max_results = cap(max_results);

    PathSet result;
    // (node index, spelling after the pivot up to and including that node)
    std::vector<std::pair<std::size_t, std::string>> stack;
    stack.emplace_back(start, std::string());

    while (!stack.empty()) {
        auto [index, spelled] = std::move(stack.back());
        stack.pop_back();

        if (snapshot_.nodes[index].kind == NodeKind::End) {
            if (max_results && result.paths.size() == max_results) {
                result.truncated = true;
                break;
            }
            result.paths.push_back(std::move(spelled));
            continue;
        }

        const auto& children = outgoing_[index];
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            const SnapshotNode& child = snapshot_.nodes[*it];
            if (child.kind == NodeKind::Symbol) {
                stack.emplace_back(*it, spelled + child.symbol);
            } else {
                stack.emplace_back(*it, spelled);
            }
        }
    }
    return result;
}

PathSet SnapshotIndex::words_through(NodeId id, std::size_t max_results) const {
    max_results = cap(max_results);
    PathSet before = prefixes(id, max_results);
    PathSet after = suffixes(id, max_results);

    PathSet result;
    result.truncated = before.truncated || after.truncated;
    for (const auto& p : before.paths) {
        for (const auto& s : after.paths) {
            if (max_results && result.paths.size() == max_results) {
                result.truncated = true;
                return result;
            }
            result.paths.push_back(p + s);
        }
    }
    return result;
}

std::vector<NodeId> SnapshotIndex::reach(NodeId id, const std::vector<std::vector<std::size_t>>& adjacency) const {
    const std::size_t start = index_of(id);
    std::vector<bool> seen(snapshot_.nodes.size(), false);
    std::vector<NodeId> result;
    std::queue<std::size_t> queue;

    seen[start] = true;
    queue.push(start);
    while (!queue.empty()) {
        std::size_t index = queue.front();
        queue.pop();
        for (std::size_t next : adjacency[index]) {
            if (!seen[next]) {
                seen[next] = true;
                result.push_back(snapshot_.nodes[next].id);
                queue.push(next);
            }
        }
    }
    return result;
}

std::vector<NodeId> SnapshotIndex::ancestors(NodeId id) const {
    return reach(id, incoming_);
}

std::vector<NodeId> SnapshotIndex::descendants(NodeId id) const {
    return reach(id, outgoing_);
}

} // namespace lattice
