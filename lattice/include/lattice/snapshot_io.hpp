#ifndef LATTICE_SNAPSHOT_IO_HPP
#define LATTICE_SNAPSHOT_IO_HPP

#include <lattice/snapshot.hpp>
#include <cstdint>
#include <vector>

namespace lattice {

/**
 * Snapshot as WXF:
 *   <|"Nodes" -> {<|"id" -> 0, "name" -> "ROOT", "level" -> 0|>, ...},
 *     "Links" -> {<|"source" -> 0, "target" -> 2, "label" -> "c"|>, ...},
 *     "Truncated" -> False|>
 */
std::vector<uint8_t> encode_snapshot(const GraphSnapshot& snapshot);

// Throws SnapshotFormatError on malformed bytes or a structurally invalid graph
GraphSnapshot decode_snapshot(const std::vector<uint8_t>& wxf_data);

} // namespace lattice

#endif // LATTICE_SNAPSHOT_IO_HPP
