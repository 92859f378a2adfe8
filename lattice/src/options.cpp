#include <lattice/options.hpp>
#include <lattice/wxf_codec.hpp>
#include <lattice/errors.hpp>
#include <lattice/debug_log.hpp>
#include <sstream>

namespace lattice {

namespace {

std::size_t read_limit(wxf::Parser& parser, const std::string& key) {
    std::size_t at = parser.position();
    int64_t value = parser.read_integer();
    if (value < 0) {
        throw SnapshotFormatError(key + " must be non-negative", at);
    }
    return static_cast<std::size_t>(value);
}

} // namespace

std::string Options::to_string() const {
    std::ostringstream oss;
    oss << "Options(fold_case=" << (fold_case ? "true" : "false")
        << ", fail_fast=" << (fail_fast ? "true" : "false")
        << ", verify=" << (verify ? "true" : "false")
        << ", max_export_nodes=" << max_export_nodes
        << ", max_traversal_results=" << max_traversal_results << ")";
    return oss.str();
}

Options parse_options(const std::vector<uint8_t>& wxf_data) {
    Options options;
    wxf::Parser parser(wxf_data);
    parser.skip_header();

    parser.read_association([&](const std::string& key, wxf::Parser& value_parser) {
        if (key == "FoldCase") {
            options.fold_case = value_parser.read_boolean();
        } else if (key == "FailFast") {
            options.fail_fast = value_parser.read_boolean();
        } else if (key == "Verify") {
            options.verify = value_parser.read_boolean();
        } else if (key == "MaxExportNodes") {
            options.max_export_nodes = read_limit(value_parser, key);
        } else if (key == "MaxTraversalResults") {
            options.max_traversal_results = read_limit(value_parser, key);
        } else {
            DEBUG_LOG("Skipping unknown option %s", key.c_str());
            value_parser.skip_value();
        }
    });

    DEBUG_LOG("Parsed %s", options.to_string().c_str());
    return options;
}

std::vector<uint8_t> serialize_options(const Options& options) {
    wxf::Writer writer;
    writer.write_header();
    writer.write_association(5);
    writer.write_rule_key("FoldCase");
    writer.write_boolean(options.fold_case);
    writer.write_rule_key("FailFast");
    writer.write_boolean(options.fail_fast);
    writer.write_rule_key("Verify");
    writer.write_boolean(options.verify);
    writer.write_rule_key("MaxExportNodes");
    writer.write_integer(static_cast<int64_t>(options.max_export_nodes));
    writer.write_rule_key("MaxTraversalResults");
    writer.write_integer(static_cast<int64_t>(options.max_traversal_results));
    return writer.release_data();
}

} // namespace lattice
