#include <cfg/ll1_table.h>
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

TEST(LL1TableTest, ExpressionGrammar) {
    TAnalysis analysis(EXPRESSION_LL1);
    auto result = analysis.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Table>(result));
    const auto& table = std::get<TLL1Table>(result);

    EXPECT_TRUE(table.Parse("i+i*i"));
    EXPECT_TRUE(table.Parse("i"));
    EXPECT_TRUE(table.Parse("(i+i)*i"));
    EXPECT_TRUE(table.Parse("((i))"));

    EXPECT_FALSE(table.Parse("i+"));
    EXPECT_FALSE(table.Parse(""));
    EXPECT_FALSE(table.Parse("ii"));
    EXPECT_FALSE(table.Parse("(i"));
    EXPECT_FALSE(table.Parse("i)"));
    EXPECT_FALSE(table.Parse("i+x"));
    EXPECT_FALSE(table.Parse("i+T"));
    EXPECT_FALSE(table.Parse("i$"));
}

TEST(LL1TableTest, ExpressionGrammarEntries) {
    TAnalysis analysis(EXPRESSION_LL1);
    auto result = analysis.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Table>(result));
    const auto& table = std::get<TLL1Table>(result);

    // S -> TX, X -> +TX, X -> e, T -> FY, Y -> *FY, Y -> e, F -> (S), F -> i
    EXPECT_EQ(table.GetRuleId(NonTerm('S'), Term('i')), 0u);
    EXPECT_EQ(table.GetRuleId(NonTerm('S'), Term('(')), 0u);
    EXPECT_EQ(table.GetRuleId(NonTerm('X'), Term('+')), 1u);
    EXPECT_EQ(table.GetRuleId(NonTerm('X'), Term(')')), 2u);
    EXPECT_EQ(table.GetRuleId(NonTerm('X'), TSymbol::EndMarker()), 2u);
    EXPECT_EQ(table.GetRuleId(NonTerm('Y'), Term('+')), 5u);
    EXPECT_EQ(table.GetRuleId(NonTerm('F'), Term('i')), 7u);
    EXPECT_FALSE(table.GetRuleId(NonTerm('S'), Term('+')));
    EXPECT_FALSE(table.GetRuleId(NonTerm('Q'), Term('i')));
    EXPECT_EQ(table.Size(), 13u);
}

TEST(LL1TableTest, NullablePrefix) {
    TAnalysis analysis({"S -> AB", "A -> a e", "B -> b"});
    auto result = analysis.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Table>(result));
    const auto& table = std::get<TLL1Table>(result);

    EXPECT_EQ(table.GetRuleId(NonTerm('A'), Term('b')), 2u);
    EXPECT_FALSE(table.GetRuleId(NonTerm('A'), TSymbol::EndMarker()));

    EXPECT_TRUE(table.Parse("ab"));
    EXPECT_TRUE(table.Parse("b"));
    EXPECT_FALSE(table.Parse("a"));
    EXPECT_FALSE(table.Parse("abb"));
    EXPECT_FALSE(table.Parse(""));
}

TEST(LL1TableTest, LeftRecursionConflict) {
    TAnalysis analysis({"S -> Sa b"});
    auto result = analysis.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Conflict>(result));
    const auto& conflict = std::get<TLL1Conflict>(result);

    EXPECT_EQ(conflict.NonTerminal, NonTerm('S'));
    EXPECT_EQ(conflict.Lookahead, Term('b'));
    EXPECT_EQ(conflict.Existing.ToString(), "S -> Sa");
    EXPECT_EQ(conflict.Incoming.ToString(), "S -> b");
    EXPECT_EQ(conflict.ToString(), "Conflict at M[S, b]: S -> Sa / S -> b");
}

TEST(LL1TableTest, FollowConflict) {
    TAnalysis analysis({"S -> Ab", "A -> b e"});
    auto result = analysis.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Conflict>(result));
    const auto& conflict = std::get<TLL1Conflict>(result);

    EXPECT_EQ(conflict.NonTerminal, NonTerm('A'));
    EXPECT_EQ(conflict.Lookahead, Term('b'));
    EXPECT_EQ(conflict.Existing.ToString(), "A -> b");
    EXPECT_EQ(conflict.Incoming.ToString(), "A -> e");
}

TEST(LL1TableTest, RepeatedProductionIsNotAConflict) {
    TAnalysis analysis({"S -> a a"});
    auto result = analysis.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Table>(result));
    EXPECT_TRUE(std::get<TLL1Table>(result).Parse("a"));
}

TEST(LL1TableTest, EpsilonGrammar) {
    TAnalysis analysis({"S -> e"});
    auto result = analysis.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Table>(result));
    const auto& table = std::get<TLL1Table>(result);

    EXPECT_TRUE(table.Parse(""));
    EXPECT_FALSE(table.Parse("a"));
    EXPECT_FALSE(table.Parse("e"));
}

TEST(LL1TableTest, BalancedParentheses) {
    TAnalysis analysis({"S -> (S)S e"});
    auto result = analysis.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Table>(result));
    const auto& table = std::get<TLL1Table>(result);

    EXPECT_TRUE(table.Parse(""));
    EXPECT_TRUE(table.Parse("()"));
    EXPECT_TRUE(table.Parse("(())()"));
    EXPECT_FALSE(table.Parse("(()"));
    EXPECT_FALSE(table.Parse(")("));
}

TEST(LL1TableTest, BuildIsDeterministic) {
    TAnalysis analysis(EXPRESSION_LL1);
    auto lhs = analysis.BuildLL1();
    auto rhs = analysis.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Table>(lhs));
    ASSERT_TRUE(std::holds_alternative<TLL1Table>(rhs));
    EXPECT_EQ(std::get<TLL1Table>(lhs), std::get<TLL1Table>(rhs));

    TAnalysis conflicting({"S -> aA aB", "A -> b", "B -> c"});
    auto first = conflicting.BuildLL1();
    auto second = conflicting.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Conflict>(first));
    ASSERT_TRUE(std::holds_alternative<TLL1Conflict>(second));
    EXPECT_EQ(std::get<TLL1Conflict>(first).ToString(), std::get<TLL1Conflict>(second).ToString());
    EXPECT_EQ(std::get<TLL1Conflict>(first).ToString(), "Conflict at M[S, a]: S -> aA / S -> aB");
}

TEST(LL1TableTest, LeftRecursiveArithmetic) {
    TAnalysis analysis({"S -> S+T T", "T -> T*F F", "F -> (S) i"});
    auto result = analysis.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Conflict>(result));
    EXPECT_EQ(std::get<TLL1Conflict>(result).ToString(), "Conflict at M[S, (]: S -> S+T / S -> T");
}
