#include <cfg/first_follow.h>
#include <gtest/gtest.h>
#include "utils.h"

using namespace NCfg;

namespace {
    const std::vector<std::string> EXPRESSION_LL1 = {
        "S -> TX",
        "X -> +TX e",
        "T -> FY",
        "Y -> *FY e",
        "F -> (S) i"
    };
}

TEST(FirstFollowTest, FirstOfEmptyStringIsEpsilon) {
    EXPECT_EQ(FirstOfString({}, TFirstMap{}), Set("e"));
}

TEST(FirstFollowTest, FirstOfString) {
    TAnalysis analysis({"S -> ABc", "A -> a e", "B -> b e"});
    const auto& first = analysis.First;

    EXPECT_EQ(FirstOfString({NonTerm('A')}, first), Set("ae"));
    EXPECT_EQ(FirstOfString({NonTerm('A'), NonTerm('B')}, first), Set("abe"));
    EXPECT_EQ(FirstOfString({NonTerm('A'), Term('c')}, first), Set("ac"));
    EXPECT_EQ(FirstOfString({Term('c'), NonTerm('A')}, first), Set("c"));
    EXPECT_EQ(FirstOfString({TSymbol::Epsilon()}, first), Set("e"));
    EXPECT_EQ(FirstOfString({TSymbol::EndMarker()}, first), Set("$"));
}

TEST(FirstFollowTest, SpecialAndTerminalSymbols) {
    TAnalysis analysis(EXPRESSION_LL1);
    const auto& first = analysis.First;

    for (const auto& terminal : analysis.Grammar.GetTerminals()) {
        EXPECT_EQ(first.at(terminal), TSymbolSet{terminal});
    }
    EXPECT_EQ(first.at(TSymbol::Epsilon()), Set("e"));
    EXPECT_EQ(first.at(TSymbol::EndMarker()), Set("$"));
}

TEST(FirstFollowTest, ExpressionGrammar) {
    TAnalysis analysis(EXPRESSION_LL1);
    const auto& first = analysis.First;
    const auto& follow = analysis.Follow;

    EXPECT_EQ(first.at(NonTerm('S')), Set("(i"));
    EXPECT_EQ(first.at(NonTerm('T')), Set("(i"));
    EXPECT_EQ(first.at(NonTerm('F')), Set("(i"));
    EXPECT_EQ(first.at(NonTerm('X')), Set("+e"));
    EXPECT_EQ(first.at(NonTerm('Y')), Set("*e"));

    EXPECT_EQ(follow.at(NonTerm('S')), Set(")$"));
    EXPECT_EQ(follow.at(NonTerm('X')), Set(")$"));
    EXPECT_EQ(follow.at(NonTerm('T')), Set("+)$"));
    EXPECT_EQ(follow.at(NonTerm('Y')), Set("+)$"));
    EXPECT_EQ(follow.at(NonTerm('F')), Set("*+)$"));
}

TEST(FirstFollowTest, NullablePrefix) {
    TAnalysis analysis({"S -> AB", "A -> a e", "B -> b"});

    EXPECT_EQ(analysis.First.at(NonTerm('S')), Set("ab"));
    EXPECT_EQ(analysis.First.at(NonTerm('A')), Set("ae"));
    EXPECT_EQ(analysis.Follow.at(NonTerm('A')), Set("b"));
    EXPECT_EQ(analysis.Follow.at(NonTerm('B')), Set("$"));
    EXPECT_EQ(analysis.Follow.at(NonTerm('S')), Set("$"));
}

TEST(FirstFollowTest, EpsilonOnlyThroughNullableDerivations) {
    TAnalysis analysis({"S -> AB c", "A -> e", "B -> A", "C -> Cc"});
    const auto& first = analysis.First;

    EXPECT_EQ(first.at(NonTerm('A')), Set("e"));
    EXPECT_EQ(first.at(NonTerm('B')), Set("e"));
    EXPECT_EQ(first.at(NonTerm('S')), Set("ce"));
    EXPECT_TRUE(first.at(NonTerm('C')).empty());
}

TEST(FirstFollowTest, FollowThroughRecursion) {
    TAnalysis analysis({"S -> aSb A", "A -> cA e"});

    EXPECT_EQ(analysis.Follow.at(NonTerm('S')), Set("b$"));
    EXPECT_EQ(analysis.Follow.at(NonTerm('A')), Set("b$"));
}

TEST(FirstFollowTest, UndefinedNonTerminal) {
    TAnalysis analysis({"S -> aB"});

    EXPECT_TRUE(analysis.First.at(NonTerm('B')).empty());
    EXPECT_EQ(analysis.First.at(NonTerm('S')), Set("a"));
    EXPECT_EQ(analysis.Follow.at(NonTerm('B')), Set("$"));
}

TEST(FirstFollowTest, StartFollowAlwaysHasEndMarker) {
    for (const auto& lines : std::vector<std::vector<std::string>>{
        EXPRESSION_LL1,
        {"S -> Sa b"},
        {"S -> (S)S e"},
        {"S -> aSa bSb c"}
    }) {
        TAnalysis analysis(lines);
        EXPECT_TRUE(analysis.Follow.at(NonTerm('S')).count(TSymbol::EndMarker()));
    }
}

TEST(FirstFollowTest, FirstSetsHaveNoNonTerminals) {
    TAnalysis analysis(EXPRESSION_LL1);
    for (const auto& [symbol, symbols] : analysis.First) {
        for (const auto& s : symbols) {
            EXPECT_FALSE(s.IsNonTerminal()) << symbol.ToString();
        }
    }
    for (const auto& production : analysis.Grammar.GetProductions()) {
        for (const auto& s : FirstOfString(production.Right, analysis.First)) {
            EXPECT_FALSE(s.IsNonTerminal()) << production.ToString();
        }
    }
}
