#include <lattice/word_list.hpp>
#include <lattice/errors.hpp>
#include <lattice/debug_log.hpp>
#include <cctype>
#include <unordered_set>

namespace lattice {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

} // namespace

std::string normalize_word(const std::string& record, std::size_t record_index, bool fold_case) {
    std::size_t begin = 0;
    std::size_t end = record.size();
    while (begin < end && is_blank(record[begin])) ++begin;
    while (end > begin && is_blank(record[end - 1])) --end;

    if (begin == end) {
        throw MalformedInput("empty word", record_index, record);
    }

    std::string word;
    word.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        unsigned char c = static_cast<unsigned char>(record[i]);
        if (c == '\0') {
            throw MalformedInput("embedded sentinel character", record_index, record);
        }
        if (c < 0x20 || c == 0x7F || is_blank(static_cast<char>(c))) {
            throw MalformedInput("disallowed character at offset " + std::to_string(i), record_index, record);
        }
        word.push_back(fold_case ? static_cast<char>(std::tolower(c)) : static_cast<char>(c));
    }
    return word;
}

WordListReport prepare_words(const std::vector<std::string>& records, const Options& options) {
    WordListReport report;
    std::unordered_set<std::string> seen;
    seen.reserve(records.size());

    for (std::size_t i = 0; i < records.size(); ++i) {
        std::string word;
        try {
            word = normalize_word(records[i], i, options.fold_case);
        } catch (const MalformedInput& e) {
            if (options.fail_fast) {
                throw;
            }
            WARN_LOG("Rejected record %zu: %s", i, e.reason().c_str());
            report.rejected.push_back({i, records[i], e.reason()});
            continue;
        }

        if (seen.insert(word).second) {
            report.words.push_back(std::move(word));
        } else {
            ++report.duplicates;
        }
    }

    DEBUG_LOG("Prepared %zu words from %zu records (%zu rejected, %zu duplicates)",
              report.words.size(), records.size(), report.rejected.size(), report.duplicates);
    return report;
}

} // namespace lattice
