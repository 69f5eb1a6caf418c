#include <gtest/gtest.h>
#include "CorpusCounter.hpp"
#include "KeySpace.hpp"
#include <sstream>
#include <stdexcept>

TEST(CorpusCounterTest, CountsOverlappingWindows) {
    std::istringstream text("abab");
    NgramFrequencies freq = countNgrams(text, "ab");

    EXPECT_EQ(freq.unigrams.at("a"), 2);
    EXPECT_EQ(freq.unigrams.at("b"), 2);
    EXPECT_EQ(freq.bigrams.at("ab"), 2);
    EXPECT_EQ(freq.bigrams.at("ba"), 1);
    EXPECT_EQ(freq.trigrams.at("aba"), 1);
    EXPECT_EQ(freq.trigrams.at("bab"), 1);
    EXPECT_EQ(freq.trigrams.size(), 2u);
}

TEST(CorpusCounterTest, LowercasesAndFiltersBeforeCounting) {
    std::istringstream text("The CAT!\nthe cat");
    NgramFrequencies freq = countNgrams(text, KeySpace::standard().symbols());

    // Filtered stream: "thecatthecat"
    EXPECT_EQ(freq.unigrams.at("t"), 4);
    EXPECT_EQ(freq.unigrams.count("T"), 0u);
    EXPECT_EQ(freq.unigrams.count(" "), 0u);
    EXPECT_EQ(freq.unigrams.count("!"), 0u);
    // Windows span the removed characters
    EXPECT_EQ(freq.bigrams.at("at"), 2);
    EXPECT_EQ(freq.bigrams.at("tt"), 1);
    EXPECT_EQ(freq.trigrams.at("cat"), 2);
}

TEST(CorpusCounterTest, ShortInputs) {
    std::istringstream empty("");
    NgramFrequencies none = countNgrams(empty, "abc");
    EXPECT_TRUE(none.unigrams.empty());
    EXPECT_TRUE(none.bigrams.empty());

    std::istringstream two("ab");
    NgramFrequencies freq = countNgrams(two, "abc");
    EXPECT_EQ(freq.unigrams.size(), 2u);
    EXPECT_EQ(freq.bigrams.size(), 1u);
    EXPECT_TRUE(freq.trigrams.empty());
}

TEST(CorpusCounterTest, MissingFileThrows) {
    EXPECT_THROW(countNgramsInFile("/nonexistent/corpus.txt", "abc"), std::runtime_error);
}
