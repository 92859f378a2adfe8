#include <gtest/gtest.h>
#include <lattice/word_list.hpp>
#include <lattice/errors.hpp>
#include <lattice/debug_log.hpp>
#include <string>
#include <vector>

using namespace lattice;

namespace {

std::vector<std::string> g_messages;

void capture(const char* message) {
    g_messages.emplace_back(message);
}

} // namespace

class WordListTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_messages.clear();
        debug::set_debug_callback(&capture);
    }

    void TearDown() override {
        debug::clear_debug_callback();
    }
};

// ============================================================================
// normalize_word
// ============================================================================

TEST_F(WordListTest, TrimsSurroundingWhitespace) {
    EXPECT_EQ(normalize_word("  cat\t\r\n", 0, true), "cat");
}

TEST_F(WordListTest, FoldsCaseWhenEnabled) {
    EXPECT_EQ(normalize_word("CaT", 0, true), "cat");
    EXPECT_EQ(normalize_word("CaT", 0, false), "CaT");
}

TEST_F(WordListTest, KeepsPunctuationAndHighBytes) {
    EXPECT_EQ(normalize_word("o'clock", 0, true), "o'clock");
    EXPECT_EQ(normalize_word("x-ray", 0, true), "x-ray");
    EXPECT_EQ(normalize_word("caf\xC3\xA9", 0, false), "caf\xC3\xA9");
}

TEST_F(WordListTest, EmptyRecordRejected) {
    try {
        normalize_word("   ", 7, true);
        FAIL() << "expected MalformedInput";
    } catch (const MalformedInput& e) {
        EXPECT_EQ(e.reason(), "empty word");
        EXPECT_EQ(e.record_index(), 7u);
        EXPECT_EQ(e.record(), "   ");
    }
}

TEST_F(WordListTest, EmbeddedNulRejected) {
    std::string record("ca\0t", 4);
    try {
        normalize_word(record, 2, true);
        FAIL() << "expected MalformedInput";
    } catch (const MalformedInput& e) {
        EXPECT_EQ(e.reason(), "embedded sentinel character");
        EXPECT_EQ(e.record(), record);
    }
}

TEST_F(WordListTest, InteriorSpaceRejected) {
    try {
        normalize_word("ice cream", 0, true);
        FAIL() << "expected MalformedInput";
    } catch (const MalformedInput& e) {
        EXPECT_EQ(e.reason(), "disallowed character at offset 3");
    }
}

TEST_F(WordListTest, ControlCharacterRejected) {
    EXPECT_THROW(normalize_word("ca\x01t", 0, true), MalformedInput);
    EXPECT_THROW(normalize_word("ca\x7Ft", 0, true), MalformedInput);
}

// ============================================================================
// prepare_words
// ============================================================================

TEST_F(WordListTest, DeduplicatesAfterNormalization) {
    Options options;
    WordListReport report = prepare_words({"Cat", "cat", " cat ", "dog", "CAT"}, options);

    EXPECT_EQ(report.words, (std::vector<std::string>{"cat", "dog"}));
    EXPECT_EQ(report.duplicates, 3u);
    EXPECT_TRUE(report.all_accepted());
}

TEST_F(WordListTest, CaseSensitiveWhenFoldingDisabled) {
    Options options;
    options.fold_case = false;
    WordListReport report = prepare_words({"Cat", "cat"}, options);
    EXPECT_EQ(report.words, (std::vector<std::string>{"Cat", "cat"}));
    EXPECT_EQ(report.duplicates, 0u);
}

TEST_F(WordListTest, CollectsRejectedRecords) {
    Options options;
    WordListReport report = prepare_words({"cat", "", "two words", "cap"}, options);

    EXPECT_EQ(report.words, (std::vector<std::string>{"cat", "cap"}));
    ASSERT_EQ(report.rejected.size(), 2u);
    EXPECT_EQ(report.rejected[0].index, 1u);
    EXPECT_EQ(report.rejected[0].reason, "empty word");
    EXPECT_EQ(report.rejected[1].index, 2u);
    EXPECT_EQ(report.rejected[1].record, "two words");
    EXPECT_FALSE(report.all_accepted());
}

TEST_F(WordListTest, RejectedRecordsLogWarning) {
    Options options;
    prepare_words({"cat", ""}, options);

    ASSERT_FALSE(g_messages.empty());
    EXPECT_EQ(g_messages[0].rfind("[WARN]", 0), 0u) << g_messages[0];
    EXPECT_NE(g_messages[0].find("Rejected record 1"), std::string::npos);
}

TEST_F(WordListTest, FailFastThrowsFirstMalformedRecord) {
    Options options;
    options.fail_fast = true;
    try {
        prepare_words({"cat", "bad\x02", ""}, options);
        FAIL() << "expected MalformedInput";
    } catch (const MalformedInput& e) {
        EXPECT_EQ(e.record_index(), 1u);
    }
}

TEST_F(WordListTest, EmptyInputGivesEmptyReport) {
    Options options;
    WordListReport report = prepare_words({}, options);
    EXPECT_TRUE(report.words.empty());
    EXPECT_TRUE(report.all_accepted());
}
