#include <gtest/gtest.h>
#include <lattice/wxf_codec.hpp>
#include <lattice/errors.hpp>

using namespace lattice;

class WXFCodecTest : public ::testing::Test {
protected:
    wxf::Parser parser_after_header(const std::vector<uint8_t>& data) {
        wxf::Parser parser(data);
        parser.skip_header();
        return parser;
    }
};

// ============================================================================
// Integers
// ============================================================================

TEST_F(WXFCodecTest, IntegerUsesSmallestWidth) {
    struct Case { int64_t value; wxf::Token token; std::size_t bytes; };
    std::vector<Case> cases = {
        {0, wxf::Token::Integer8, 1},
        {-128, wxf::Token::Integer8, 1},
        {127, wxf::Token::Integer8, 1},
        {128, wxf::Token::Integer16, 2},
        {-32768, wxf::Token::Integer16, 2},
        {40000, wxf::Token::Integer32, 4},
        {5000000000LL, wxf::Token::Integer64, 8},
    };

    for (const auto& c : cases) {
        wxf::Writer writer;
        writer.write_header();
        writer.write_integer(c.value);
        EXPECT_EQ(writer.size(), 2 + 1 + c.bytes) << "value " << c.value;

        wxf::Parser parser = parser_after_header(writer.data());
        EXPECT_EQ(parser.peek_token(), c.token) << "value " << c.value;
        EXPECT_EQ(parser.read_integer(), c.value);
        EXPECT_TRUE(parser.at_end());
    }
}

TEST_F(WXFCodecTest, VarintSpansBytes) {
    wxf::Writer writer;
    writer.write_varint(300);
    ASSERT_EQ(writer.size(), 2u);
    EXPECT_EQ(writer.data()[0], 0xAC);
    EXPECT_EQ(writer.data()[1], 0x02);

    wxf::Parser parser(writer.data());
    EXPECT_EQ(parser.read_varint(), 300u);
}

// ============================================================================
// Strings, symbols, functions
// ============================================================================

TEST_F(WXFCodecTest, StringLayout) {
    wxf::Writer writer;
    writer.write_header();
    writer.write_string("cat");

    std::vector<uint8_t> expected = {'8', ':', 'S', 3, 'c', 'a', 't'};
    EXPECT_EQ(writer.data(), expected);

    wxf::Parser parser = parser_after_header(writer.data());
    EXPECT_EQ(parser.read_string(), "cat");
}

TEST_F(WXFCodecTest, BooleansAreSymbols) {
    wxf::Writer writer;
    writer.write_header();
    writer.write_boolean(true);
    writer.write_boolean(false);

    wxf::Parser parser = parser_after_header(writer.data());
    EXPECT_EQ(parser.peek_token(), wxf::Token::Symbol);
    EXPECT_TRUE(parser.read_boolean());
    EXPECT_FALSE(parser.read_boolean());
}

TEST_F(WXFCodecTest, NonBooleanSymbolRejected) {
    wxf::Writer writer;
    writer.write_header();
    writer.write_symbol("Automatic");

    wxf::Parser parser = parser_after_header(writer.data());
    EXPECT_THROW(parser.read_boolean(), SnapshotFormatError);
}

TEST_F(WXFCodecTest, ListHeadChecked) {
    wxf::Writer writer;
    writer.write_header();
    writer.write_function("Graph", 2);

    wxf::Parser parser = parser_after_header(writer.data());
    EXPECT_THROW(parser.read_list(), SnapshotFormatError);
}

TEST_F(WXFCodecTest, AssociationCallbackSeesEveryKey) {
    wxf::Writer writer;
    writer.write_header();
    writer.write_association(3);
    writer.write_rule_key("a");
    writer.write_integer(1);
    writer.write_rule_key("b");
    writer.write_list(2);
    writer.write_string("x");
    writer.write_string("y");
    writer.write_rule_key("c");
    writer.write_string("z");

    std::vector<std::string> keys;
    int64_t a = 0;
    std::string c;
    wxf::Parser parser = parser_after_header(writer.data());
    parser.read_association([&](const std::string& key, wxf::Parser& value) {
        keys.push_back(key);
        if (key == "a") {
            a = value.read_integer();
        } else if (key == "c") {
            c = value.read_string();
        } else {
            value.skip_value();
        }
    });

    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(a, 1);
    EXPECT_EQ(c, "z");
    EXPECT_TRUE(parser.at_end());
}

TEST_F(WXFCodecTest, SkipNestedAssociation) {
    wxf::Writer writer;
    writer.write_header();
    writer.write_list(2);
    writer.write_association(1);
    writer.write_rule_key("inner");
    writer.write_list(1);
    writer.write_integer(100000);
    writer.write_string("after");

    wxf::Parser parser = parser_after_header(writer.data());
    ASSERT_EQ(parser.read_list(), 2u);
    parser.skip_value();
    EXPECT_EQ(parser.read_string(), "after");
}

// ============================================================================
// Malformed input
// ============================================================================

TEST_F(WXFCodecTest, InvalidHeader) {
    std::vector<uint8_t> data = {'7', ':'};
    wxf::Parser parser(data);
    EXPECT_THROW(parser.skip_header(), SnapshotFormatError);
}

TEST_F(WXFCodecTest, CompressedHeaderUnsupported) {
    std::vector<uint8_t> data = {'C', ':'};
    wxf::Parser parser(data);
    EXPECT_THROW(parser.skip_header(), SnapshotFormatError);
}

TEST_F(WXFCodecTest, TruncatedStringReportsPosition) {
    std::vector<uint8_t> data = {'8', ':', 'S', 10, 'a', 'b'};
    wxf::Parser parser = parser_after_header(data);
    try {
        parser.read_string();
        FAIL() << "expected SnapshotFormatError";
    } catch (const SnapshotFormatError& e) {
        EXPECT_EQ(e.position(), 4u);
    }
}

TEST_F(WXFCodecTest, EmptyInput) {
    std::vector<uint8_t> data;
    wxf::Parser parser(data);
    EXPECT_TRUE(parser.at_end());
    EXPECT_THROW(parser.skip_header(), SnapshotFormatError);
}

TEST_F(WXFCodecTest, WrongTokenForInteger) {
    wxf::Writer writer;
    writer.write_header();
    writer.write_string("12");

    wxf::Parser parser = parser_after_header(writer.data());
    EXPECT_THROW(parser.read_integer(), SnapshotFormatError);
}

TEST_F(WXFCodecTest, ElementCountBoundedByRemainingBytes) {
    wxf::Writer list_writer;
    list_writer.write_header();
    list_writer.write_list(std::size_t(1) << 40);

    wxf::Parser list_parser = parser_after_header(list_writer.data());
    try {
        list_parser.read_list();
        FAIL() << "expected SnapshotFormatError";
    } catch (const SnapshotFormatError& e) {
        EXPECT_EQ(e.position(), 3u);
    }

    wxf::Writer assoc_writer;
    assoc_writer.write_header();
    assoc_writer.write_association(1000);

    wxf::Parser assoc_parser = parser_after_header(assoc_writer.data());
    EXPECT_THROW(assoc_parser.read_association([](const std::string&, wxf::Parser&) {}),
                 SnapshotFormatError);
}

TEST_F(WXFCodecTest, RemainingTracksPosition) {
    std::vector<uint8_t> data = {'8', ':', 'C', 5};
    wxf::Parser parser(data);
    EXPECT_EQ(parser.remaining(), 4u);
    parser.skip_header();
    EXPECT_EQ(parser.remaining(), 2u);
    parser.read_integer();
    EXPECT_EQ(parser.remaining(), 0u);
}
