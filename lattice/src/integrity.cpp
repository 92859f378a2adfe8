#include <lattice/integrity.hpp>
#include <lattice/errors.hpp>
#include <lattice/debug_log.hpp>
#include <algorithm>
#include <iterator>
#include <queue>
#include <set>
#include <sstream>

namespace lattice {

namespace {

template<typename T>
void append_list(std::ostringstream& oss, const std::vector<T>& items, std::size_t limit = 10) {
    oss << "[";
    for (std::size_t i = 0; i < items.size() && i < limit; ++i) {
        if (i > 0) oss << ", ";
        oss << items[i];
    }
    if (items.size() > limit) oss << ", ... (" << items.size() - limit << " more)";
    oss << "]";
}

} // namespace

std::string IntegrityReport::describe() const {
    std::ostringstream oss;
    if (passed()) {
        oss << "passed (" << reconstructed_paths << " paths)";
        return oss.str();
    }
    if (!acyclic) {
        oss << "cycle ";
        append_list(oss, cycle_witness);
        return oss.str();
    }
    bool first = true;
    if (!missing_words.empty()) {
        oss << "missing words ";
        append_list(oss, missing_words);
        first = false;
    }
    if (!extra_words.empty()) {
        if (!first) oss << "; ";
        oss << "extra words ";
        append_list(oss, extra_words);
        first = false;
    }
    if (!unreachable_nodes.empty()) {
        if (!first) oss << "; ";
        oss << "unreachable nodes ";
        append_list(oss, unreachable_nodes);
    }
    return oss.str();
}

std::vector<NodeId> IntegrityChecker::find_cycle(const Lattice& lattice) {
    enum : uint8_t { WHITE, GRAY, BLACK };
    std::vector<uint8_t> color(lattice.node_count(), WHITE);

    struct Frame {
        NodeId id;
        std::vector<NodeId> successors;
        std::size_t next;
    };
    std::vector<Frame> stack;
    stack.push_back({lattice.root(), lattice.successors(lattice.root()), 0});
    color[lattice.root()] = GRAY;

    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.next == top.successors.size()) {
            color[top.id] = BLACK;
            stack.pop_back();
            continue;
        }

        NodeId child = top.successors[top.next++];
        if (color[child] == GRAY) {
            std::vector<NodeId> witness;
            auto on_stack = std::find_if(stack.begin(), stack.end(),
                                         [child](const Frame& f) { return f.id == child; });
            for (auto it = on_stack; it != stack.end(); ++it) {
                witness.push_back(it->id);
            }
            witness.push_back(child);
            return witness;
        }
        if (color[child] == WHITE) {
            color[child] = GRAY;
            stack.push_back({child, lattice.successors(child), 0});
        }
    }
    return {};
}

std::vector<std::string> IntegrityChecker::reconstruct_words(const Lattice& lattice) {
    std::vector<std::string> words;
    std::vector<std::pair<NodeId, std::string>> stack;
    stack.emplace_back(lattice.root(), std::string());

    while (!stack.empty()) {
        auto [id, spelled] = std::move(stack.back());
        stack.pop_back();

        const LatticeNode& node = lattice.node(id);
        if (node.terminal) {
            words.push_back(spelled);
        }
        // reverse so the first transition is explored first
        for (auto it = node.transitions.rbegin(); it != node.transitions.rend(); ++it) {
            const LatticeNode& target = lattice.node(it->target);
            if (target.kind == NodeKind::Symbol) {
                stack.emplace_back(it->target, spelled + target.symbol);
            } else {
                stack.emplace_back(it->target, spelled);
            }
        }
    }
    return words;
}

IntegrityReport IntegrityChecker::verify(const Lattice& lattice, const std::vector<std::string>& words) {
    IntegrityReport report;

    report.cycle_witness = find_cycle(lattice);
    if (!report.cycle_witness.empty()) {
        report.acyclic = false;
        DEBUG_LOG("Integrity check found a cycle of length %zu", report.cycle_witness.size() - 1);
        return report;
    }

    std::vector<std::string> reconstructed = reconstruct_words(lattice);
    report.reconstructed_paths = reconstructed.size();

    std::set<std::string> expected(words.begin(), words.end());
    std::set<std::string> actual(reconstructed.begin(), reconstructed.end());
    std::set_difference(expected.begin(), expected.end(), actual.begin(), actual.end(),
                        std::back_inserter(report.missing_words));
    std::set_difference(actual.begin(), actual.end(), expected.begin(), expected.end(),
                        std::back_inserter(report.extra_words));

    std::vector<bool> reached(lattice.node_count(), false);
    std::queue<NodeId> queue;
    queue.push(lattice.root());
    reached[lattice.root()] = true;
    while (!queue.empty()) {
        NodeId id = queue.front();
        queue.pop();
        for (NodeId next : lattice.successors(id)) {
            if (!reached[next]) {
                reached[next] = true;
                queue.push(next);
            }
        }
    }
    for (NodeId id = 0; id < lattice.node_count(); ++id) {
        if (!reached[id] && id != lattice.end()) {
            report.unreachable_nodes.push_back(id);
        }
    }

    DEBUG_LOG("Integrity check over %zu expected words: %s", expected.size(), report.describe().c_str());
    return report;
}

void IntegrityChecker::enforce(const Lattice& lattice, const std::vector<std::string>& words) {
    IntegrityReport report = verify(lattice, words);
    if (!report.passed()) {
        throw IntegrityViolation(report.describe(),
                                 std::move(report.missing_words),
                                 std::move(report.extra_words),
                                 std::move(report.cycle_witness));
    }
}

} // namespace lattice
