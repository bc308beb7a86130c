/*
 * Suggestion tests - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <reqline/util/suggest.hpp>
#include <reqline/parse/grammar.hpp>

using namespace reqline;

TEST(Levenshtein, Distances) {
    EXPECT_EQ(levenshtein("", ""), 0u);
    EXPECT_EQ(levenshtein("abc", ""), 3u);
    EXPECT_EQ(levenshtein("kitten", "sitting"), 3u);
    EXPECT_EQ(levenshtein("reed", "read"), 1u);
    EXPECT_EQ(levenshtein("read", "read"), 0u);
}

TEST(Suggest, ClosestVerb) {
    EXPECT_EQ(suggest("reed", verb_names()), "read");
    EXPECT_EQ(suggest("sav", verb_names()), "save");
    EXPECT_EQ(suggest("uplod", verb_names()), "upload");
}

TEST(Suggest, ClosestClause) {
    EXPECT_EQ(suggest("ass", clause_keys()), "as");
    EXPECT_EQ(suggest("incude", clause_keys()), "include");
    EXPECT_EQ(suggest("expct", clause_keys()), "expect");
}

TEST(Suggest, NothingCloseEnough) {
    EXPECT_EQ(suggest("frobnicate", verb_names()), "");
    EXPECT_EQ(suggest("xyz", {}), "");
}

TEST(Suggest, TieKeepsVocabularyOrder) {
    EXPECT_EQ(suggest("ab", {"ax", "ay"}), "ax");
}
