#ifndef LATTICE_WXF_CODEC_HPP
#define LATTICE_WXF_CODEC_HPP

#include <lattice/errors.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

/**
 * Wolfram Exchange Format (WXF) codec.
 * Covers the subset the lattice exchanges with a Wolfram Language front end:
 * integers, strings, symbols, List[...] and Association[...].
 */
namespace lattice {
namespace wxf {

enum class Token : uint8_t {
    String = 'S',
    Symbol = 's',
    Integer8 = 'C',
    Integer16 = 'j',
    Integer32 = 'i',
    Integer64 = 'L',
    Real64 = 'r',           // skipped, never produced
    BinaryString = 'B',     // skipped, never produced
    Function = 'f',
    Association = 'A',
    Rule = '-',
};

class Writer {
private:
    std::vector<uint8_t> data_;

    void write_little_endian(uint64_t bits, int byte_count);

public:
    Writer() = default;

    void write_byte(uint8_t value);
    void write_varint(std::size_t value);
    void write_header();

    // Smallest integer token that holds the value, as Wolfram does
    void write_integer(int64_t value);
    void write_string(const std::string& value);
    void write_symbol(const std::string& value);
    void write_boolean(bool value) { write_symbol(value ? "True" : "False"); }

    void write_function(const std::string& head, std::size_t arg_count);
    void write_list(std::size_t length) { write_function("List", length); }

    // Association header; follow with `entry_count` calls to write_rule_key + value
    void write_association(std::size_t entry_count);
    void write_rule_key(const std::string& key);

    const std::vector<uint8_t>& data() const noexcept { return data_; }
    std::vector<uint8_t> release_data() noexcept { return std::move(data_); }
    std::size_t size() const noexcept { return data_.size(); }
};

class Parser {
private:
    const uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;

    void ensure_bytes(std::size_t count) const;
    uint64_t read_little_endian(int byte_count);
    std::string read_counted_bytes();
    // Element counts larger than the bytes left cannot be honest
    void check_count(std::size_t count, std::size_t at) const;

public:
    Parser(const uint8_t* data, std::size_t size)
        : data_(data), size_(size), pos_(0) {}

    explicit Parser(const std::vector<uint8_t>& data)
        : Parser(data.data(), data.size()) {}

    uint8_t read_byte();
    std::size_t read_varint();
    void skip_header();
    Token peek_token() const;

    // Accepts any integer width
    int64_t read_integer();
    std::string read_string();
    std::string read_symbol();
    bool read_boolean();

    // Consumes `f`, the argument count and the head; returns the argument count.
    // A count that exceeds the remaining bytes raises SnapshotFormatError.
    std::size_t read_function(const std::string& expected_head);
    std::size_t read_list() { return read_function("List"); }

    // Invokes the callback once per string-keyed rule; the callback must consume the value
    using AssociationCallback = std::function<void(const std::string&, Parser&)>;
    void read_association(const AssociationCallback& callback);

    void skip_value();

    std::size_t position() const noexcept { return pos_; }
    std::size_t remaining() const noexcept { return pos_ < size_ ? size_ - pos_ : 0; }
    bool at_end() const noexcept { return pos_ >= size_; }
};

} // namespace wxf
} // namespace lattice

#endif // LATTICE_WXF_CODEC_HPP
