#include <lattice/lattice.hpp>
#include <sstream>
#include <stdexcept>

namespace lattice {

Lattice::Lattice() {
    nodes_.emplace_back(NodeKind::Root);
    root_ = 0;
    nodes_.emplace_back(NodeKind::End);
    end_ = 1;
}

void Lattice::check_node(NodeId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("Lattice node " + std::to_string(id) + " out of range");
    }
}

const LatticeNode& Lattice::node(NodeId id) const {
    check_node(id);
    return nodes_[id];
}

std::size_t Lattice::edge_count() const {
    std::size_t count = 0;
    for (const auto& n : nodes_) {
        count += n.transitions.size();
        if (n.terminal) ++count;
    }
    return count;
}

NodeId Lattice::add_node(char symbol) {
    nodes_.emplace_back(NodeKind::Symbol, symbol);
    return nodes_.size() - 1;
}

NodeId Lattice::find_transition(NodeId from, char symbol) const {
    check_node(from);
    for (const auto& t : nodes_[from].transitions) {
        if (t.symbol == symbol) return t.target;
    }
    return INVALID_NODE;
}

void Lattice::add_transition(NodeId from, char symbol, NodeId to) {
    check_node(from);
    check_node(to);
    if (from == to) {
        throw std::invalid_argument("Self-loop on node " + std::to_string(from));
    }
    if (nodes_[to].kind != NodeKind::Symbol) {
        throw std::invalid_argument("Transition target must be a character node");
    }
    if (find_transition(from, symbol) != INVALID_NODE) {
        throw std::invalid_argument("Node " + std::to_string(from) + " already has a transition on '" +
                                    std::string(1, symbol) + "'");
    }
    nodes_[from].transitions.emplace_back(symbol, to);
}

void Lattice::retarget_transition(NodeId from, char symbol, NodeId to) {
    check_node(from);
    check_node(to);
    for (auto& t : nodes_[from].transitions) {
        if (t.symbol == symbol) {
            t.target = to;
            return;
        }
    }
    throw std::invalid_argument("Node " + std::to_string(from) + " has no transition on '" +
                                std::string(1, symbol) + "'");
}

void Lattice::set_transitions(NodeId from, std::vector<Transition> transitions) {
    check_node(from);
    for (const auto& t : transitions) {
        check_node(t.target);
    }
    nodes_[from].transitions = std::move(transitions);
}

void Lattice::set_terminal(NodeId id, bool terminal) {
    check_node(id);
    if (nodes_[id].kind != NodeKind::Symbol) {
        throw std::invalid_argument("Only character nodes can be terminal");
    }
    nodes_[id].terminal = terminal;
}

std::vector<NodeId> Lattice::successors(NodeId id) const {
    const LatticeNode& n = node(id);
    std::vector<NodeId> result;
    result.reserve(n.transitions.size() + 1);
    for (const auto& t : n.transitions) {
        result.push_back(t.target);
    }
    if (n.terminal) {
        result.push_back(end_);
    }
    return result;
}

std::string Lattice::summary() const {
    std::size_t terminals = 0;
    for (const auto& n : nodes_) {
        if (n.terminal) ++terminals;
    }
    std::ostringstream oss;
    oss << "Lattice(nodes=" << node_count() << ", edges=" << edge_count()
        << ", terminal=" << terminals << ")";
    return oss.str();
}

} // namespace lattice
