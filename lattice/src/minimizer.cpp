#include <lattice/minimizer.hpp>
#include <lattice/debug_log.hpp>
#include <algorithm>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace lattice {

std::size_t NodeSignature::hash() const {
    std::size_t hash = std::hash<uint8_t>{}(static_cast<uint8_t>(kind));
    hash ^= std::hash<char>{}(symbol) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
    hash ^= (std::hash<bool>{}(terminal) << 1);
    hash ^= std::hash<std::size_t>{}(transitions.size()) + 0x9e3779b9 + (hash << 6) + (hash >> 2);

    std::hash<Transition> transition_hasher;
    for (const auto& t : transitions) {
        hash ^= transition_hasher(t) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
    }
    return hash;
}

std::string NodeSignature::to_string() const {
    std::ostringstream oss;
    oss << "Signature(" << label_of(kind, symbol) << (terminal ? ", terminal" : "") << ", [";
    for (std::size_t i = 0; i < transitions.size(); ++i) {
        oss << transitions[i].symbol << "->" << transitions[i].target;
        if (i < transitions.size() - 1) oss << ", ";
    }
    oss << "])";
    return oss.str();
}

NodeSignature NodeSignature::of(const LatticeNode& node) {
    NodeSignature sig{node.kind, node.symbol, node.terminal, node.transitions};
    std::sort(sig.transitions.begin(), sig.transitions.end());
    return sig;
}

std::vector<NodeId> Minimizer::post_order(const Lattice& lattice, std::vector<std::size_t>& height) const {
    enum : uint8_t { WHITE, GRAY, BLACK };
    std::vector<uint8_t> color(lattice.node_count(), WHITE);
    height.assign(lattice.node_count(), 0);

    std::vector<NodeId> order;
    order.reserve(lattice.node_count());

    // (node, index of the next transition to explore)
    std::vector<std::pair<NodeId, std::size_t>> stack;
    stack.emplace_back(lattice.root(), 0);
    color[lattice.root()] = GRAY;

    while (!stack.empty()) {
        NodeId id = stack.back().first;
        std::size_t next = stack.back().second;
        const auto& transitions = lattice.node(id).transitions;

        if (next < transitions.size()) {
            stack.back().second = next + 1;
            NodeId child = transitions[next].target;
            if (color[child] == GRAY) {
                throw std::logic_error("Cannot minimize: cycle through node " + std::to_string(child));
            }
            if (color[child] == WHITE) {
                color[child] = GRAY;
                stack.emplace_back(child, 0);
            }
        } else {
            std::size_t h = 0;
            for (const auto& t : transitions) {
                h = std::max(h, height[t.target] + 1);
            }
            height[id] = h;
            color[id] = BLACK;
            order.push_back(id);
            stack.pop_back();
        }
    }
    return order;
}

Lattice Minimizer::minimize(const Lattice& raw) {
    stats_ = MinimizationStats{};
    stats_.nodes_before = raw.node_count();

    std::vector<std::size_t> height;
    std::vector<NodeId> order = post_order(raw, height);

    // Bucket by height; nodes of one height never depend on each other
    std::size_t max_height = 0;
    for (NodeId id : order) {
        max_height = std::max(max_height, height[id]);
    }
    std::vector<std::vector<NodeId>> by_height(max_height + 1);
    for (NodeId id : order) {
        by_height[height[id]].push_back(id);
    }
    stats_.max_height = max_height;

    std::vector<NodeId> canonical(raw.node_count(), INVALID_NODE);
    canonical[raw.end()] = raw.end();
    std::vector<std::vector<Transition>> rewritten(raw.node_count());

    {
        std::unordered_map<NodeSignature, NodeId, NodeSignatureHash> registry;
        registry.reserve(order.size());

        for (const auto& bucket : by_height) {
            for (NodeId id : bucket) {
                const LatticeNode& node = raw.node(id);

                LatticeNode view(node.kind, node.symbol);
                view.terminal = node.terminal;
                view.transitions.reserve(node.transitions.size());
                for (const auto& t : node.transitions) {
                    view.transitions.emplace_back(t.symbol, canonical[t.target]);
                }

                auto [it, inserted] = registry.emplace(NodeSignature::of(view), id);
                if (inserted) {
                    canonical[id] = id;
                    rewritten[id] = std::move(view.transitions);
                } else {
                    canonical[id] = it->second;
                    ++stats_.merges;
                }
            }
        }
        DEBUG_LOG("Registered %zu canonical signatures over %zu heights", registry.size(), by_height.size());
    }

    // Compact the representatives into a fresh arena, BFS order from ROOT
    Lattice result;
    std::vector<NodeId> remap(raw.node_count(), INVALID_NODE);
    remap[raw.root()] = result.root();
    remap[raw.end()] = result.end();

    std::vector<NodeId> visited;
    std::queue<NodeId> queue;
    queue.push(raw.root());
    while (!queue.empty()) {
        NodeId id = queue.front();
        queue.pop();
        visited.push_back(id);
        for (const auto& t : rewritten[id]) {
            if (remap[t.target] == INVALID_NODE) {
                remap[t.target] = result.add_node(raw.node(t.target).symbol);
                queue.push(t.target);
            }
        }
    }

    for (NodeId id : visited) {
        std::vector<Transition> transitions;
        transitions.reserve(rewritten[id].size());
        for (const auto& t : rewritten[id]) {
            transitions.emplace_back(t.symbol, remap[t.target]);
        }
        result.set_transitions(remap[id], std::move(transitions));
        if (raw.node(id).terminal) {
            result.set_terminal(remap[id], true);
        }
    }

    stats_.pruned = raw.node_count() - 1 - order.size();
    stats_.nodes_after = result.node_count();
    DEBUG_LOG("Minimized %zu -> %zu nodes (%zu merges, %zu pruned)",
              stats_.nodes_before, stats_.nodes_after, stats_.merges, stats_.pruned);
    return result;
}

} // namespace lattice
