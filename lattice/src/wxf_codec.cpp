#include <lattice/wxf_codec.hpp>
#include <limits>
#include <string>

namespace lattice {
namespace wxf {

// Writer implementation

void Writer::write_byte(uint8_t value) {
    data_.push_back(value);
}

void Writer::write_varint(std::size_t value) {
    while (value >= 0x80) {
        data_.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    data_.push_back(static_cast<uint8_t>(value & 0x7F));
}

void Writer::write_header() {
    // Uncompressed WXF
    data_.push_back('8');
    data_.push_back(':');
}

void Writer::write_little_endian(uint64_t bits, int byte_count) {
    for (int i = 0; i < byte_count; i++) {
        write_byte(static_cast<uint8_t>((bits >> (i * 8)) & 0xFF));
    }
}

void Writer::write_integer(int64_t value) {
    if (value >= std::numeric_limits<int8_t>::min() && value <= std::numeric_limits<int8_t>::max()) {
        write_byte(static_cast<uint8_t>(Token::Integer8));
        write_little_endian(static_cast<uint64_t>(value), 1);
    } else if (value >= std::numeric_limits<int16_t>::min() && value <= std::numeric_limits<int16_t>::max()) {
        write_byte(static_cast<uint8_t>(Token::Integer16));
        write_little_endian(static_cast<uint64_t>(value), 2);
    } else if (value >= std::numeric_limits<int32_t>::min() && value <= std::numeric_limits<int32_t>::max()) {
        write_byte(static_cast<uint8_t>(Token::Integer32));
        write_little_endian(static_cast<uint64_t>(value), 4);
    } else {
        write_byte(static_cast<uint8_t>(Token::Integer64));
        write_little_endian(static_cast<uint64_t>(value), 8);
    }
}

void Writer::write_string(const std::string& value) {
    write_byte(static_cast<uint8_t>(Token::String));
    write_varint(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
}

void Writer::write_symbol(const std::string& value) {
    write_byte(static_cast<uint8_t>(Token::Symbol));
    write_varint(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
}

void Writer::write_function(const std::string& head, std::size_t arg_count) {
    write_byte(static_cast<uint8_t>(Token::Function));
    write_varint(arg_count);
    write_symbol(head);
}

void Writer::write_association(std::size_t entry_count) {
    write_byte(static_cast<uint8_t>(Token::Association));
    write_varint(entry_count);
}

void Writer::write_rule_key(const std::string& key) {
    write_byte(static_cast<uint8_t>(Token::Rule));
    write_string(key);
}

// Parser implementation

void Parser::ensure_bytes(std::size_t count) const {
    if (pos_ > size_ || count > size_ - pos_) {
        throw SnapshotFormatError("Unexpected end of WXF data", pos_);
    }
}

void Parser::check_count(std::size_t count, std::size_t at) const {
    if (count > remaining()) {
        throw SnapshotFormatError("Element count " + std::to_string(count) + " exceeds remaining " +
                                  std::to_string(remaining()) + " bytes", at);
    }
}

uint8_t Parser::read_byte() {
    ensure_bytes(1);
    return data_[pos_++];
}

std::size_t Parser::read_varint() {
    std::size_t value = 0;
    std::size_t shift = 0;
    uint8_t byte;

    do {
        byte = read_byte();
        if (shift >= 63) {
            throw SnapshotFormatError("Varint too large", pos_ - 1);
        }
        value |= (std::size_t(byte & 0x7F) << shift);
        shift += 7;
    } while (byte & 0x80);

    return value;
}

void Parser::skip_header() {
    uint8_t first = read_byte();
    uint8_t second = read_byte();

    if (first == '8' && second == ':') {
        return;
    } else if (first == 'C' && second == ':') {
        throw SnapshotFormatError("Compressed WXF format not supported", 0);
    } else {
        throw SnapshotFormatError("Invalid WXF header", 0);
    }
}

Token Parser::peek_token() const {
    ensure_bytes(1);
    return static_cast<Token>(data_[pos_]);
}

uint64_t Parser::read_little_endian(int byte_count) {
    ensure_bytes(static_cast<std::size_t>(byte_count));
    uint64_t bits = 0;
    for (int i = 0; i < byte_count; i++) {
        bits |= static_cast<uint64_t>(data_[pos_ + i]) << (i * 8);
    }
    pos_ += static_cast<std::size_t>(byte_count);
    return bits;
}

int64_t Parser::read_integer() {
    Token token = static_cast<Token>(read_byte());
    switch (token) {
        case Token::Integer8:
            return static_cast<int8_t>(read_little_endian(1));
        case Token::Integer16:
            return static_cast<int16_t>(read_little_endian(2));
        case Token::Integer32:
            return static_cast<int32_t>(read_little_endian(4));
        case Token::Integer64:
            return static_cast<int64_t>(read_little_endian(8));
        default:
            throw SnapshotFormatError("Expected integer", pos_ - 1);
    }
}

std::string Parser::read_counted_bytes() {
    std::size_t len = read_varint();
    ensure_bytes(len);
    std::string result(reinterpret_cast<const char*>(data_ + pos_), len);
    pos_ += len;
    return result;
}

std::string Parser::read_string() {
    if (peek_token() != Token::String) {
        throw SnapshotFormatError("Expected string", pos_);
    }
    read_byte();
    return read_counted_bytes();
}

std::string Parser::read_symbol() {
    if (peek_token() != Token::Symbol) {
        throw SnapshotFormatError("Expected symbol", pos_);
    }
    read_byte();
    return read_counted_bytes();
}

bool Parser::read_boolean() {
    std::size_t at = pos_;
    std::string symbol = read_symbol();
    if (symbol == "True") return true;
    if (symbol == "False") return false;
    throw SnapshotFormatError("Expected True or False, got " + symbol, at);
}

std::size_t Parser::read_function(const std::string& expected_head) {
    if (peek_token() != Token::Function) {
        throw SnapshotFormatError("Expected " + expected_head + " function", pos_);
    }
    read_byte();

    std::size_t count_at = pos_;
    std::size_t arg_count = read_varint();
    check_count(arg_count, count_at);
    std::size_t at = pos_;
    std::string head = read_symbol();
    if (head != expected_head) {
        throw SnapshotFormatError("Expected " + expected_head + " function, got " + head, at);
    }
    return arg_count;
}

void Parser::read_association(const AssociationCallback& callback) {
    if (peek_token() != Token::Association) {
        throw SnapshotFormatError("Expected association", pos_);
    }
    read_byte();

    std::size_t count_at = pos_;
    std::size_t num_entries = read_varint();
    check_count(num_entries, count_at);

    for (std::size_t i = 0; i < num_entries; i++) {
        if (peek_token() != Token::Rule) {
            throw SnapshotFormatError("Expected rule marker in association", pos_);
        }
        read_byte();

        std::string key = read_string();
        callback(key, *this);
    }
}

void Parser::skip_value() {
    Token token = static_cast<Token>(read_byte());
    switch (token) {
        case Token::String:
        case Token::Symbol:
        case Token::BinaryString: {
            std::size_t len = read_varint();
            ensure_bytes(len);
            pos_ += len;
            break;
        }
        case Token::Integer8:  read_little_endian(1); break;
        case Token::Integer16: read_little_endian(2); break;
        case Token::Integer32: read_little_endian(4); break;
        case Token::Integer64:
        case Token::Real64:    read_little_endian(8); break;
        case Token::Function: {
            std::size_t arg_count = read_varint();
            skip_value();  // head
            for (std::size_t i = 0; i < arg_count; i++) {
                skip_value();
            }
            break;
        }
        case Token::Association: {
            std::size_t num_entries = read_varint();
            for (std::size_t i = 0; i < num_entries; i++) {
                if (static_cast<Token>(read_byte()) != Token::Rule) {
                    throw SnapshotFormatError("Expected rule marker in association", pos_ - 1);
                }
                skip_value();
                skip_value();
            }
            break;
        }
        default:
            throw SnapshotFormatError("Unsupported WXF token", pos_ - 1);
    }
}

} // namespace wxf
} // namespace lattice
