#ifndef LATTICE_TRIE_BUILDER_HPP
#define LATTICE_TRIE_BUILDER_HPP

#include <lattice/lattice.hpp>
#include <string>
#include <vector>

namespace lattice {

/**
 * Assembles the raw (unminimized) trie. Each word becomes a character path
 * from ROOT; the last node of the path gets an edge into the shared END node.
 */
class TrieBuilder {
private:
    Lattice lattice_;
    std::size_t word_count_ = 0;
    std::size_t record_count_ = 0;   // insert() calls, duplicates and rejects included

public:
    TrieBuilder() = default;

    /**
     * Insert one word. Returns false if the word was already present.
     * Throws MalformedInput for an empty word or an embedded NUL, carrying the
     * zero-based index of this call among all insert() calls.
     */
    bool insert(const std::string& word);

    std::size_t word_count() const { return word_count_; }
    std::size_t record_count() const { return record_count_; }
    const Lattice& lattice() const { return lattice_; }

    // Hand the trie over; the builder is left empty
    Lattice release();

    static Lattice build(const std::vector<std::string>& words);
};

} // namespace lattice

#endif // LATTICE_TRIE_BUILDER_HPP
