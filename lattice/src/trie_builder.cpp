#include <lattice/trie_builder.hpp>
#include <lattice/errors.hpp>
#include <lattice/debug_log.hpp>

namespace lattice {

bool TrieBuilder::insert(const std::string& word) {
    const std::size_t record_index = record_count_++;
    if (word.empty()) {
        throw MalformedInput("empty word", record_index, word);
    }
    if (word.find('\0') != std::string::npos) {
        throw MalformedInput("embedded sentinel character", record_index, word);
    }

    NodeId current = lattice_.root();
    for (char c : word) {
        NodeId next = lattice_.find_transition(current, c);
        // make a new path if it doesn't exist yet
        if (next == INVALID_NODE) {
            next = lattice_.add_node(c);
            lattice_.add_transition(current, c, next);
        }
        current = next;
    }

    if (lattice_.node(current).terminal) {
        return false;
    }
    lattice_.set_terminal(current, true);
    ++word_count_;
    return true;
}

Lattice TrieBuilder::release() {
    Lattice result = std::move(lattice_);
    lattice_ = Lattice();
    word_count_ = 0;
    record_count_ = 0;
    return result;
}

Lattice TrieBuilder::build(const std::vector<std::string>& words) {
    TrieBuilder builder;
    for (const auto& word : words) {
        builder.insert(word);
    }
    DEBUG_LOG("Built raw trie from %zu words (%zu duplicates): %s",
              builder.word_count(), words.size() - builder.word_count(), builder.lattice().summary().c_str());
    return builder.release();
}

} // namespace lattice
