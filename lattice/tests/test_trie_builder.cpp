#include <gtest/gtest.h>
#include <lattice/trie_builder.hpp>
#include <lattice/errors.hpp>
#include "test_helpers.hpp"

using namespace lattice;

class TrieBuilderTest : public ::testing::Test {};

TEST_F(TrieBuilderTest, EmptyLatticeHasRootAndEnd) {
    Lattice lattice;
    EXPECT_EQ(lattice.node_count(), 2u);
    EXPECT_EQ(lattice.edge_count(), 0u);
    EXPECT_EQ(lattice.node(lattice.root()).kind, NodeKind::Root);
    EXPECT_EQ(lattice.node(lattice.end()).kind, NodeKind::End);
    EXPECT_EQ(lattice.node(lattice.root()).label(), "ROOT");
    EXPECT_EQ(lattice.node(lattice.end()).label(), "END");
}

TEST_F(TrieBuilderTest, SingleWordIsOnePath) {
    TrieBuilder builder;
    EXPECT_TRUE(builder.insert("cat"));

    const Lattice& lattice = builder.lattice();
    EXPECT_EQ(lattice.node_count(), 5u);     // ROOT, c, a, t, END
    EXPECT_EQ(lattice.edge_count(), 4u);     // 3 transitions + 1 into END

    NodeId t = test_utils::walk(lattice, "cat");
    ASSERT_NE(t, INVALID_NODE);
    EXPECT_TRUE(lattice.node(t).terminal);
    EXPECT_FALSE(lattice.node(test_utils::walk(lattice, "ca")).terminal);
    EXPECT_EQ(lattice.successors(t), std::vector<NodeId>{lattice.end()});
}

TEST_F(TrieBuilderTest, SharedPrefixReusesNodes) {
    TrieBuilder builder;
    builder.insert("cat");
    builder.insert("cap");

    const Lattice& lattice = builder.lattice();
    EXPECT_EQ(lattice.node_count(), 6u);     // ROOT, c, a, t, p, END
    NodeId a = test_utils::walk(lattice, "ca");
    ASSERT_EQ(lattice.node(a).transitions.size(), 2u);
    EXPECT_EQ(lattice.node(a).transitions[0].symbol, 't');
    EXPECT_EQ(lattice.node(a).transitions[1].symbol, 'p');
}

TEST_F(TrieBuilderTest, PrefixWordMarksInteriorNodeTerminal) {
    TrieBuilder builder;
    builder.insert("cats");
    builder.insert("cat");

    const Lattice& lattice = builder.lattice();
    NodeId t = test_utils::walk(lattice, "cat");
    EXPECT_TRUE(lattice.node(t).terminal);
    EXPECT_EQ(lattice.node(t).transitions.size(), 1u);
    EXPECT_EQ(lattice.successors(t).back(), lattice.end());
}

TEST_F(TrieBuilderTest, DuplicateInsertReturnsFalse) {
    TrieBuilder builder;
    EXPECT_TRUE(builder.insert("cat"));
    std::size_t nodes = builder.lattice().node_count();
    EXPECT_FALSE(builder.insert("cat"));
    EXPECT_EQ(builder.lattice().node_count(), nodes);
    EXPECT_EQ(builder.word_count(), 1u);
}

TEST_F(TrieBuilderTest, MalformedWordsThrow) {
    TrieBuilder builder;
    EXPECT_THROW(builder.insert(""), MalformedInput);
    EXPECT_THROW(builder.insert(std::string("a\0b", 3)), MalformedInput);
    EXPECT_EQ(builder.word_count(), 0u);
}

TEST_F(TrieBuilderTest, MalformedIndexCountsEveryRecord) {
    try {
        TrieBuilder::build({"cat", "cat", "dog", ""});
        FAIL() << "expected MalformedInput";
    } catch (const MalformedInput& e) {
        EXPECT_EQ(e.record_index(), 3u);
    }

    TrieBuilder builder;
    builder.insert("cat");
    EXPECT_THROW(builder.insert(""), MalformedInput);
    builder.insert("cat");
    try {
        builder.insert(std::string("x\0", 2));
        FAIL() << "expected MalformedInput";
    } catch (const MalformedInput& e) {
        EXPECT_EQ(e.record_index(), 3u);
    }
    EXPECT_EQ(builder.record_count(), 4u);
    EXPECT_EQ(builder.word_count(), 1u);
}

TEST_F(TrieBuilderTest, RawTrieSizeForCatsRatsBats) {
    Lattice lattice = TrieBuilder::build({"cats", "rats", "bats"});
    // ROOT + 12 character nodes + END
    EXPECT_EQ(lattice.node_count(), 14u);
    EXPECT_EQ(lattice.edge_count(), 15u);
}

TEST_F(TrieBuilderTest, ReleaseResetsBuilder) {
    TrieBuilder builder;
    builder.insert("ab");
    Lattice released = builder.release();
    EXPECT_EQ(released.node_count(), 4u);
    EXPECT_EQ(builder.word_count(), 0u);
    EXPECT_EQ(builder.record_count(), 0u);
    EXPECT_EQ(builder.lattice().node_count(), 2u);
}

TEST_F(TrieBuilderTest, TransitionGuards) {
    Lattice lattice;
    NodeId a = lattice.add_node('a');
    lattice.add_transition(lattice.root(), 'a', a);

    EXPECT_THROW(lattice.add_transition(lattice.root(), 'a', a), std::invalid_argument);
    EXPECT_THROW(lattice.add_transition(a, 'a', a), std::invalid_argument);
    EXPECT_THROW(lattice.add_transition(a, 'x', lattice.end()), std::invalid_argument);
    EXPECT_THROW(lattice.add_transition(a, 'x', 99), std::out_of_range);
    EXPECT_THROW(lattice.set_terminal(lattice.root(), true), std::invalid_argument);
    EXPECT_THROW(lattice.node(42), std::out_of_range);
}
