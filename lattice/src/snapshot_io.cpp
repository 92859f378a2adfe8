#include <lattice/snapshot_io.hpp>
#include <lattice/wxf_codec.hpp>
#include <lattice/errors.hpp>
#include <lattice/debug_log.hpp>
#include <string>

namespace lattice {

namespace {

NodeId read_id(wxf::Parser& parser, const char* field) {
    std::size_t at = parser.position();
    int64_t value = parser.read_integer();
    if (value < 0) {
        throw SnapshotFormatError(std::string(field) + " must be non-negative", at);
    }
    return static_cast<NodeId>(value);
}

SnapshotNode read_node(wxf::Parser& parser) {
    SnapshotNode node{INVALID_NODE, NodeKind::Symbol, '\0', 0};
    bool has_id = false;
    bool has_name = false;
    std::size_t at = parser.position();

    parser.read_association([&](const std::string& key, wxf::Parser& value) {
        if (key == "id") {
            node.id = read_id(value, "id");
            has_id = true;
        } else if (key == "name") {
            std::size_t name_at = value.position();
            std::string name = value.read_string();
            if (name == ROOT_LABEL) {
                node.kind = NodeKind::Root;
            } else if (name == END_LABEL) {
                node.kind = NodeKind::End;
            } else if (name.size() == 1) {
                node.kind = NodeKind::Symbol;
                node.symbol = name[0];
            } else {
                throw SnapshotFormatError("node name must be ROOT, END or one character, got \"" + name + "\"",
                                          name_at);
            }
            has_name = true;
        } else if (key == "level") {
            node.level = read_id(value, "level");
        } else {
            value.skip_value();
        }
    });

    if (!has_id || !has_name) {
        throw SnapshotFormatError("node entry needs \"id\" and \"name\"", at);
    }
    return node;
}

SnapshotEdge read_edge(wxf::Parser& parser) {
    SnapshotEdge edge{INVALID_NODE, INVALID_NODE, std::string()};
    std::size_t at = parser.position();

    parser.read_association([&](const std::string& key, wxf::Parser& value) {
        if (key == "source") {
            edge.source = read_id(value, "source");
        } else if (key == "target") {
            edge.target = read_id(value, "target");
        } else if (key == "label") {
            edge.label = value.read_string();
        } else {
            value.skip_value();
        }
    });

    if (edge.source == INVALID_NODE || edge.target == INVALID_NODE) {
        throw SnapshotFormatError("link entry needs \"source\" and \"target\"", at);
    }
    return edge;
}

} // namespace

std::vector<uint8_t> encode_snapshot(const GraphSnapshot& snapshot) {
    wxf::Writer writer;
    writer.write_header();
    writer.write_association(3);

    writer.write_rule_key("Nodes");
    writer.write_list(snapshot.nodes.size());
    for (const auto& n : snapshot.nodes) {
        writer.write_association(3);
        writer.write_rule_key("id");
        writer.write_integer(static_cast<int64_t>(n.id));
        writer.write_rule_key("name");
        writer.write_string(n.label());
        writer.write_rule_key("level");
        writer.write_integer(static_cast<int64_t>(n.level));
    }

    writer.write_rule_key("Links");
    writer.write_list(snapshot.edges.size());
    for (const auto& e : snapshot.edges) {
        writer.write_association(3);
        writer.write_rule_key("source");
        writer.write_integer(static_cast<int64_t>(e.source));
        writer.write_rule_key("target");
        writer.write_integer(static_cast<int64_t>(e.target));
        writer.write_rule_key("label");
        writer.write_string(e.label);
    }

    writer.write_rule_key("Truncated");
    writer.write_boolean(snapshot.truncated);

    DEBUG_LOG("Encoded %s into %zu bytes", snapshot.summary().c_str(), writer.size());
    return writer.release_data();
}

GraphSnapshot decode_snapshot(const std::vector<uint8_t>& wxf_data) {
    GraphSnapshot snapshot;
    wxf::Parser parser(wxf_data);
    parser.skip_header();

    bool has_nodes = false;
    parser.read_association([&](const std::string& key, wxf::Parser& value) {
        if (key == "Nodes") {
            std::size_t count = value.read_list();
            snapshot.nodes.reserve(count);
            for (std::size_t i = 0; i < count; ++i) {
                snapshot.nodes.push_back(read_node(value));
            }
            has_nodes = true;
        } else if (key == "Links") {
            std::size_t count = value.read_list();
            snapshot.edges.reserve(count);
            for (std::size_t i = 0; i < count; ++i) {
                snapshot.edges.push_back(read_edge(value));
            }
        } else if (key == "Truncated") {
            snapshot.truncated = value.read_boolean();
        } else {
            value.skip_value();
        }
    });

    if (!has_nodes) {
        throw SnapshotFormatError("missing \"Nodes\"");
    }
    snapshot.validate();

    DEBUG_LOG("Decoded %s", snapshot.summary().c_str());
    return snapshot;
}

} // namespace lattice
