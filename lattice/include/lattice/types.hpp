#ifndef LATTICE_TYPES_HPP
#define LATTICE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <functional>

namespace lattice {

using NodeId = std::size_t;

constexpr NodeId INVALID_NODE = std::numeric_limits<NodeId>::max();

// Sentinel names shared by the exporter, the snapshot codec and traversal
constexpr const char* ROOT_LABEL = "ROOT";
constexpr const char* END_LABEL = "END";
constexpr const char* END_TRANSITION_LABEL = "<END>";

/**
 * Kind of a lattice node.
 * ROOT and END live in the same id space as character nodes but are not
 * characters; a node's kind, not its symbol, tells them apart.
 */
enum class NodeKind : uint8_t {
    Root,
    Symbol,
    End
};

/**
 * Outgoing transition of a node: the next character and the node it leads to.
 * Transitions into END are not stored here; they are the node's terminal flag.
 */
struct Transition {
    char symbol;
    NodeId target;

    Transition(char c = '\0', NodeId t = INVALID_NODE) : symbol(c), target(t) {}

    bool operator==(const Transition& other) const {
        return symbol == other.symbol && target == other.target;
    }

    bool operator!=(const Transition& other) const {
        return !(*this == other);
    }

    bool operator<(const Transition& other) const {
        if (symbol != other.symbol) return symbol < other.symbol;
        return target < other.target;
    }
};

inline std::string label_of(NodeKind kind, char symbol) {
    switch (kind) {
        case NodeKind::Root: return ROOT_LABEL;
        case NodeKind::End:  return END_LABEL;
        default:             return std::string(1, symbol);
    }
}

} // namespace lattice

namespace std {
    template<>
    struct hash<lattice::Transition> {
        std::size_t operator()(const lattice::Transition& t) const {
            std::size_t h = std::hash<char>{}(t.symbol);
            h ^= std::hash<lattice::NodeId>{}(t.target) + 0x9e3779b9 + (h << 6) + (h >> 2);
            return h;
        }
    };
}

#endif // LATTICE_TYPES_HPP
