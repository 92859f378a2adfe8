#ifndef LATTICE_OPTIONS_HPP
#define LATTICE_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lattice {

/**
 * Tunables for the construction pipeline and for traversal.
 * A zero limit means unlimited.
 */
struct Options {
    bool fold_case = true;                   // lowercase every word before insertion
    bool fail_fast = false;                  // throw on the first malformed record
    bool verify = true;                      // run the integrity gate before export
    std::size_t max_export_nodes = 0;        // display-only truncation of the snapshot
    std::size_t max_traversal_results = 0;   // advisory cap per enumeration

    std::string to_string() const;
};

/**
 * Decode options from a WXF association such as
 *   <|"FoldCase" -> False, "MaxExportNodes" -> 5000|>
 * Keys not listed in Options are skipped. Values of the wrong type raise
 * SnapshotFormatError.
 */
Options parse_options(const std::vector<uint8_t>& wxf_data);

// Encode as the association parse_options reads
std::vector<uint8_t> serialize_options(const Options& options);

} // namespace lattice

#endif // LATTICE_OPTIONS_HPP
