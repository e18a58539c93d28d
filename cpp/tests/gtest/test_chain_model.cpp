// =============================================================================
// Chain Model Tests
// =============================================================================

#include <gtest/gtest.h>
#include "babbler/generative/chain_model.hpp"
#include <string>
#include <vector>

using namespace babbler::generative;

class ChainModelTest : public ::testing::Test {
protected:
    // "" -> Hello, "hello" -> " ", " " -> world, "world" exits
    static ChainModel hello_world_model() {
        ChainModel model(1);
        model.analyze({"Hello", " ", "world"});
        return model;
    }

    Rng rng{12345};
};

TEST_F(ChainModelTest, IngestionCreatesExpectedTransitions) {
    ChainModel model(2);
    model.analyze({"the", "cat", "sat"});

    const Node* start = model.find_node("");
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->links, std::vector<std::string>({"the"}));
    EXPECT_EQ(start->freqs, std::vector<uint64_t>({1}));
    EXPECT_EQ(start->weight, 1u);
    EXPECT_FALSE(start->is_exit);

    const Node* the = model.find_node("the");
    ASSERT_NE(the, nullptr);
    EXPECT_EQ(the->links, std::vector<std::string>({"cat"}));
    EXPECT_EQ(the->weight, 1u);

    const Node* thecat = model.find_node("thecat");
    ASSERT_NE(thecat, nullptr);
    EXPECT_EQ(thecat->links, std::vector<std::string>({"sat"}));
    EXPECT_EQ(thecat->freqs, std::vector<uint64_t>({1}));
    EXPECT_EQ(thecat->weight, 1u);

    const Node* catsat = model.find_node("catsat");
    ASSERT_NE(catsat, nullptr);
    EXPECT_TRUE(catsat->links.empty());
    EXPECT_EQ(catsat->weight, 1u);
    EXPECT_TRUE(catsat->is_exit);

    EXPECT_EQ(model.node_count(), 4u);
    EXPECT_EQ(model.edge_count(), 3u);
}

TEST_F(ChainModelTest, RepeatedTransitionsAccumulateFrequency) {
    ChainModel model(1);
    model.analyze({"a", "b"});
    model.analyze({"a", "b"});

    const Node* a = model.find_node("a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->links, std::vector<std::string>({"b"}));
    EXPECT_EQ(a->freqs, std::vector<uint64_t>({2}));
    EXPECT_EQ(a->weight, 2u);

    const Node* b = model.find_node("b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->weight, 2u);
    EXPECT_EQ(b->exit_weight(), 2u);
}

TEST_F(ChainModelTest, WeightEqualsFrequenciesPlusExits) {
    ChainModel model(1);
    model.analyze({"x", "y"});
    model.analyze({"x", "z"});
    model.analyze({"y", "x"});

    for (const auto& [tail, node] : model.to_snapshot().graph) {
        EXPECT_EQ(node.links.size(), node.freqs.size()) << tail;
        EXPECT_EQ(node.weight, node.edge_weight() + node.exit_weight()) << tail;
        EXPECT_EQ(node.is_exit, node.exit_weight() > 0) << tail;
    }

    const Node* x = model.find_node("x");
    ASSERT_NE(x, nullptr);
    EXPECT_EQ(x->links, std::vector<std::string>({"y", "z"}));
    EXPECT_EQ(x->weight, 3u);  // two edges plus one exit
    EXPECT_TRUE(x->is_exit);
}

TEST_F(ChainModelTest, TailsAreLowercasedWordsKeepCase) {
    ChainModel model(1);
    model.analyze({"Deer", "Run"});

    EXPECT_EQ(model.find_node("Deer"), nullptr);
    const Node* deer = model.find_node("deer");
    ASSERT_NE(deer, nullptr);
    EXPECT_EQ(deer->links, std::vector<std::string>({"Run"}));
    EXPECT_NE(model.find_node("run"), nullptr);
}

TEST_F(ChainModelTest, OrderIsFlooredToOne) {
    EXPECT_EQ(ChainModel(0).order(), 1u);
    EXPECT_EQ(ChainModel(-3).order(), 1u);
    EXPECT_EQ(ChainModel(5).order(), 5u);
}

TEST_F(ChainModelTest, EmptyInputIsIgnored) {
    ChainModel model(2);
    model.analyze({});
    EXPECT_EQ(model.node_count(), 0u);
}

TEST_F(ChainModelTest, UnknownStartContextYieldsEmptyResult) {
    ChainModel model(3);
    GenerationResult result = model.generate_once(5, 10, {"anything"}, 2.0, 1.5, rng);
    EXPECT_EQ(result.text, "");
    EXPECT_EQ(result.score, 0.0);
    EXPECT_EQ(model.node_count(), 0u);
}

// Every step has a single choice, so the score is deterministic
TEST_F(ChainModelTest, StopsAtExitAfterTargetLength) {
    ChainModel model = hello_world_model();

    GenerationResult result = model.generate_once(3, 10, {"WORLD"}, 2.0, 1.5, rng);
    EXPECT_EQ(result.text, "Hello world");
    EXPECT_DOUBLE_EQ(result.score, 3.0);  // three certain steps, one keyword
}

TEST_F(ChainModelTest, ExitBeforeTargetLengthIsSoftBreak) {
    ChainModel model = hello_world_model();

    // Exit draw at step 3 adds 1, restart adds 3 more; "world" is already
    // found so the second one does not count again
    GenerationResult result = model.generate_once(5, 20, {"world"}, 2.0, 1.5, rng);
    EXPECT_EQ(result.text, "Hello world Hello world");
    EXPECT_DOUBLE_EQ(result.score, 7.0);
}

TEST_F(ChainModelTest, KeywordListRefillsOnceAllAreFound) {
    ChainModel model(1);
    model.analyze({"a1", " ", "a2"});

    // "a1" exhausts the list, the refilled "a" then matches "a2"
    GenerationResult result = model.generate_once(3, 10, {"a"}, 1.0, 1.0, rng);
    EXPECT_EQ(result.text, "a1 a2");
    EXPECT_DOUBLE_EQ(result.score, 6.0);  // three certain steps, two found
}

TEST_F(ChainModelTest, RefilledKeywordsSteerLaterDraws) {
    ChainModel model(1);
    model.analyze({"a1", " ", "a2"});
    model.analyze({"a1", " ", "b"});

    // At " " only the refilled keyword picks "a2" over "b"
    for (uint32_t seed = 0; seed < 32; ++seed) {
        Rng local(seed);
        GenerationResult result = model.generate_once(3, 10, {"a"}, 1.0, 1.0, local);
        EXPECT_EQ(result.text, "a1 a2");
        EXPECT_DOUBLE_EQ(result.score, 6.0);
    }
}

TEST_F(ChainModelTest, MaxLengthExhaustionFails) {
    ChainModel model = hello_world_model();

    GenerationResult result = model.generate_once(3, 3, {"world"}, 2.0, 1.5, rng);
    EXPECT_EQ(result.text, "");
    EXPECT_EQ(result.score, 0.0);
}

TEST_F(ChainModelTest, ScoreCollapsesWithoutKeywordMatch) {
    ChainModel model = hello_world_model();

    GenerationResult no_keywords = model.generate_once(3, 10, {}, 2.0, 1.5, rng);
    EXPECT_EQ(no_keywords.text, "Hello world");
    EXPECT_EQ(no_keywords.score, 0.0);

    GenerationResult unmatched = model.generate_once(3, 10, {"moose"}, 2.0, 0.0, rng);
    EXPECT_EQ(unmatched.text, "Hello world");
    EXPECT_EQ(unmatched.score, 0.0);
}

TEST_F(ChainModelTest, KeywordsBiasTowardMatchingEdges) {
    ChainModel model(1);
    for (int i = 0; i < 50; ++i) {
        model.analyze({"go", "north"});
    }
    model.analyze({"go", "south"});

    // "south" is 1 in 51 unbiased; the filter makes it certain
    for (int i = 0; i < 20; ++i) {
        GenerationResult result = model.generate_once(2, 5, {"SOUTH"}, 1.0, 1.0, rng);
        EXPECT_EQ(result.text, "gosouth");
        EXPECT_DOUBLE_EQ(result.score, 2.0);
    }
}

TEST_F(ChainModelTest, RarerChoicesScoreHigher) {
    ChainModel model(1);
    model.analyze({"a", "b"});
    model.analyze({"a", "c"});
    model.analyze({"a", "c"});
    model.analyze({"a", "c"});

    // Keyword "a" is matched at step 0; the draw at "a" is unfiltered
    for (int i = 0; i < 50; ++i) {
        GenerationResult result = model.generate_once(2, 5, {"a"}, 1.0, 1.0, rng);
        if (result.text == "ab") {
            EXPECT_DOUBLE_EQ(result.score, 1.0 + 4.0);
        } else {
            ASSERT_EQ(result.text, "ac");
            EXPECT_DOUBLE_EQ(result.score, 1.0 + 4.0 / 3.0);
        }
    }
}

TEST_F(ChainModelTest, DuplicateKeywordsAreMergedCaseInsensitively) {
    ChainModel model = hello_world_model();

    // One distinct keyword, matched once
    GenerationResult result = model.generate_once(3, 10, {"World", "world", "WORLD", ""}, 1.0, 2.0, rng);
    EXPECT_DOUBLE_EQ(result.score, 3.0);
}

TEST_F(ChainModelTest, ExponentsAreClamped) {
    ChainModel model(2);
    model.analyze({"The", " ", "deer", " ", "ran", " ", "into", " ", "the", " ", "forest", "."});
    model.analyze({"The", " ", "moose", " ", "walked", " ", "into", " ", "the", " ", "lake", "."});
    model.analyze({"A", " ", "deer", " ", "walked", " ", "into", " ", "the", " ", "lake", "."});

    const std::vector<std::string> keywords = {"deer", "lake"};
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        Rng high(seed), clamped_high(seed), low(seed), clamped_low(seed);

        GenerationResult a = model.generate_once(6, 30, keywords, 1000.0, 1.0, high);
        GenerationResult b = model.generate_once(6, 30, keywords, 16.0, 1.0, clamped_high);
        EXPECT_EQ(a.text, b.text);
        EXPECT_DOUBLE_EQ(a.score, b.score);

        GenerationResult c = model.generate_once(6, 30, keywords, 0.0, 0.0, low);
        GenerationResult d = model.generate_once(6, 30, keywords, 0.0625, 0.0625, clamped_low);
        EXPECT_EQ(c.text, d.text);
        EXPECT_DOUBLE_EQ(c.score, d.score);
    }
}

TEST_F(ChainModelTest, GenerationDoesNotCreateNodes) {
    ChainModel model = hello_world_model();
    const ChainSnapshot before = model.to_snapshot();

    for (int i = 0; i < 10; ++i) {
        model.generate_once(4, 12, {"hello", "world"}, 2.0, 1.5, rng);
    }

    EXPECT_EQ(model.to_snapshot(), before);
}

TEST_F(ChainModelTest, SeededGenerationIsReproducible) {
    ChainModel model(1);
    model.analyze({"one", " ", "two", " ", "three"});
    model.analyze({"two", " ", "one", " ", "three"});
    model.analyze({"three", " ", "two"});

    Rng first(99), second(99);
    for (int i = 0; i < 10; ++i) {
        GenerationResult a = model.generate_once(3, 15, {"two"}, 2.0, 1.5, first);
        GenerationResult b = model.generate_once(3, 15, {"two"}, 2.0, 1.5, second);
        EXPECT_EQ(a.text, b.text);
        EXPECT_DOUBLE_EQ(a.score, b.score);
    }
}
