#ifndef LATTICE_WORD_LIST_HPP
#define LATTICE_WORD_LIST_HPP

#include <lattice/options.hpp>
#include <string>
#include <vector>

namespace lattice {

struct RejectedRecord {
    std::size_t index;
    std::string record;
    std::string reason;
};

/**
 * Outcome of preparing raw records for insertion.
 * `words` holds the normalized, distinct words in first-seen order.
 */
struct WordListReport {
    std::vector<std::string> words;
    std::vector<RejectedRecord> rejected;
    std::size_t duplicates = 0;

    bool all_accepted() const { return rejected.empty(); }
};

/**
 * Normalize one record (trim, optional case folding) and check it.
 * Throws MalformedInput if the record is empty or contains a character
 * that may not appear in a word.
 */
std::string normalize_word(const std::string& record, std::size_t record_index, bool fold_case);

/**
 * Normalize and validate every record. Malformed records are collected in
 * the report unless options.fail_fast is set, in which case the first one
 * is rethrown.
 */
WordListReport prepare_words(const std::vector<std::string>& records, const Options& options);

} // namespace lattice

#endif // LATTICE_WORD_LIST_HPP
