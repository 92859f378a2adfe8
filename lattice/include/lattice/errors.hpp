#ifndef LATTICE_ERRORS_HPP
#define LATTICE_ERRORS_HPP

#include <lattice/types.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace lattice {

// Base of every error raised by the lattice library
class LatticeError : public std::runtime_error {
public:
    explicit LatticeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * A word list record that cannot be inserted (empty, or containing a
 * character that is not allowed in a word).
 */
class MalformedInput : public LatticeError {
public:
    MalformedInput(const std::string& reason, std::size_t record_index, const std::string& record)
        : LatticeError("Malformed input at record " + std::to_string(record_index) + ": " + reason)
        , reason_(reason), record_index_(record_index), record_(record) {}

    const std::string& reason() const noexcept { return reason_; }
    std::size_t record_index() const noexcept { return record_index_; }
    const std::string& record() const noexcept { return record_; }

private:
    std::string reason_;
    std::size_t record_index_;
    std::string record_;
};

/**
 * The minimized graph no longer encodes exactly the input word set, or it
 * contains a cycle. Carries the mismatching words or the cycle witness.
 */
class IntegrityViolation : public LatticeError {
public:
    IntegrityViolation(const std::string& message,
                       std::vector<std::string> missing_words,
                       std::vector<std::string> extra_words,
                       std::vector<NodeId> cycle_witness)
        : LatticeError("Integrity violation: " + message)
        , missing_words_(std::move(missing_words))
        , extra_words_(std::move(extra_words))
        , cycle_witness_(std::move(cycle_witness)) {}

    const std::vector<std::string>& missing_words() const noexcept { return missing_words_; }
    const std::vector<std::string>& extra_words() const noexcept { return extra_words_; }
    const std::vector<NodeId>& cycle_witness() const noexcept { return cycle_witness_; }

private:
    std::vector<std::string> missing_words_;
    std::vector<std::string> extra_words_;
    std::vector<NodeId> cycle_witness_;
};

// Traversal query against an id that the snapshot does not contain
class UnreachableNodeReference : public LatticeError {
public:
    explicit UnreachableNodeReference(NodeId node_id)
        : LatticeError("Node " + std::to_string(node_id) + " is not present in the snapshot")
        , node_id_(node_id) {}

    NodeId node_id() const noexcept { return node_id_; }

private:
    NodeId node_id_;
};

// Malformed WXF bytes for a snapshot or an options association
class SnapshotFormatError : public LatticeError {
public:
    SnapshotFormatError(const std::string& message, std::size_t position = 0)
        : LatticeError("Snapshot format error: " + message), position_(position) {}

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

} // namespace lattice

#endif // LATTICE_ERRORS_HPP
