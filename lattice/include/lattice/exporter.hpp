#ifndef LATTICE_EXPORTER_HPP
#define LATTICE_EXPORTER_HPP

#include <lattice/lattice.hpp>
#include <lattice/snapshot.hpp>

namespace lattice {

/**
 * Assign snapshot ids in BFS discovery order from ROOT (ROOT is 0) and record
 * each node's level as its BFS distance, i.e. the shortest root distance even
 * when a shared node has several incoming edges. Only nodes reachable from
 * ROOT are exported.
 */
GraphSnapshot export_snapshot(const Lattice& lattice);

} // namespace lattice

#endif // LATTICE_EXPORTER_HPP
