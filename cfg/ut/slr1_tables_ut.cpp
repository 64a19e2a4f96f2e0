#include <cfg/slr1_tables.h>
#include <gtest/gtest.h>
#include "utils.h"

using namespace NCfg;

namespace {
    const std::vector<std::string> ARITHMETIC = {
        "S -> S+T T",
        "T -> T*F F",
        "F -> (S) i"
    };
}

TEST(Slr1TablesTest, ArithmeticGrammar) {
    TAnalysis analysis(ARITHMETIC);
    auto result = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(result));
    const auto& tables = std::get<TSlr1Tables>(result);

    EXPECT_TRUE(tables.Parse("i"));
    EXPECT_TRUE(tables.Parse("i+i*i"));
    EXPECT_TRUE(tables.Parse("(i+i)*i"));
    EXPECT_TRUE(tables.Parse("((i))*(i)+i"));

    EXPECT_FALSE(tables.Parse(""));
    EXPECT_FALSE(tables.Parse("i+"));
    EXPECT_FALSE(tables.Parse("()"));
    EXPECT_FALSE(tables.Parse("i)"));
    EXPECT_FALSE(tables.Parse("(i"));
    EXPECT_FALSE(tables.Parse("i i"));
    EXPECT_FALSE(tables.Parse("S"));
}

TEST(Slr1TablesTest, ArithmeticEntries) {
    TAnalysis analysis(ARITHMETIC);
    auto result = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(result));
    const auto& tables = std::get<TSlr1Tables>(result);
    const auto& actions = tables.GetActionTable();
    const auto& gotos = tables.GetGotoTable();

    EXPECT_EQ(actions.GetAction(0, Term('(')), TAction::Shift(1));
    EXPECT_EQ(actions.GetAction(0, Term('i')), TAction::Shift(2));
    EXPECT_FALSE(actions.GetAction(0, Term('+')));
    EXPECT_FALSE(actions.GetAction(0, TSymbol::EndMarker()));

    // F -> i on FOLLOW(F)
    for (char c : std::string("+*)")) {
        EXPECT_EQ(actions.GetAction(2, Term(c)), TAction::Reduce(5));
    }
    EXPECT_EQ(actions.GetAction(2, TSymbol::EndMarker()), TAction::Reduce(5));

    auto accepting = gotos.GetState(0, NonTerm('S'));
    ASSERT_TRUE(accepting);
    EXPECT_EQ(actions.GetAction(*accepting, TSymbol::EndMarker()), TAction::Accept());
    EXPECT_FALSE(gotos.GetState(0, NonTerm('Q')));
    EXPECT_FALSE(gotos.GetState(*accepting, NonTerm('S')));
}

TEST(Slr1TablesTest, Actions) {
    EXPECT_EQ(TAction::Shift(3).ToString(), "s3");
    EXPECT_EQ(TAction::Reduce(2).ToString(), "r2");
    EXPECT_EQ(TAction::Accept().ToString(), "acc");

    EXPECT_EQ(TAction::Shift(3).GetState(), 3u);
    EXPECT_EQ(TAction::Reduce(2).GetRuleId(), 2u);
    EXPECT_THROW(TAction::Shift(3).GetRuleId(), std::runtime_error);
    EXPECT_THROW(TAction::Accept().GetState(), std::runtime_error);
    EXPECT_NE(TAction::Shift(2), TAction::Reduce(2));
}

TEST(Slr1TablesTest, LeftRecursion) {
    TAnalysis analysis({"S -> Sa b"});
    auto result = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(result));
    const auto& tables = std::get<TSlr1Tables>(result);

    EXPECT_TRUE(tables.Parse("b"));
    EXPECT_TRUE(tables.Parse("baa"));
    EXPECT_FALSE(tables.Parse("a"));
    EXPECT_FALSE(tables.Parse("ab"));
    EXPECT_FALSE(tables.Parse(""));
}

TEST(Slr1TablesTest, NullablePrefix) {
    TAnalysis analysis({"S -> AB", "A -> a e", "B -> b"});
    auto result = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(result));
    const auto& tables = std::get<TSlr1Tables>(result);

    EXPECT_EQ(tables.GetActionTable().GetAction(0, Term('b')), TAction::Reduce(2));
    EXPECT_TRUE(tables.Parse("ab"));
    EXPECT_TRUE(tables.Parse("b"));
    EXPECT_FALSE(tables.Parse("a"));
    EXPECT_FALSE(tables.Parse("abb"));
    EXPECT_FALSE(tables.Parse(""));
}

TEST(Slr1TablesTest, EmptyLanguageMember) {
    TAnalysis analysis({"S -> (S)S e"});
    auto result = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(result));
    const auto& tables = std::get<TSlr1Tables>(result);

    EXPECT_TRUE(tables.Parse(""));
    EXPECT_TRUE(tables.Parse("()()"));
    EXPECT_TRUE(tables.Parse("(()())"));
    EXPECT_FALSE(tables.Parse("(()"));
    EXPECT_FALSE(tables.Parse(")"));
}

TEST(Slr1TablesTest, LL1GrammarIsAlsoSlr1) {
    TAnalysis analysis({"S -> TX", "X -> +TX e", "T -> FY", "Y -> *FY e", "F -> (S) i"});
    auto result = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(result));
    const auto& tables = std::get<TSlr1Tables>(result);

    EXPECT_TRUE(tables.Parse("i+i*i"));
    EXPECT_TRUE(tables.Parse("(i+i)*i"));
    EXPECT_FALSE(tables.Parse("i+"));
    EXPECT_FALSE(tables.Parse("i*"));
}

TEST(Slr1TablesTest, ShiftReduceConflict) {
    TAnalysis analysis({"S -> S+S i"});
    auto result = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Conflict>(result));
    const auto& conflict = std::get<TSlr1Conflict>(result);

    EXPECT_EQ(conflict.Kind, EConflictKind::ShiftReduce);
    EXPECT_EQ(conflict.Lookahead, Term('+'));
    EXPECT_EQ(conflict.Existing.GetType(), EActionType::Shift);
    EXPECT_EQ(conflict.Incoming, TAction::Reduce(0));
    EXPECT_EQ(conflict.IncomingText, "reduce S -> S+S");
    EXPECT_EQ(conflict.ToString(),
        "Shift/Reduce conflict at state " + std::to_string(conflict.State) + ", symbol +: "
        + conflict.ExistingText + " / reduce S -> S+S");
}

TEST(Slr1TablesTest, ReduceReduceConflict) {
    TAnalysis analysis({"S -> A B", "A -> a", "B -> a"});
    auto result = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Conflict>(result));
    const auto& conflict = std::get<TSlr1Conflict>(result);

    EXPECT_EQ(conflict.Kind, EConflictKind::ReduceReduce);
    EXPECT_EQ(conflict.Lookahead, TSymbol::EndMarker());
    EXPECT_EQ(conflict.Existing, TAction::Reduce(2));
    EXPECT_EQ(conflict.Incoming, TAction::Reduce(3));
    EXPECT_EQ(conflict.ExistingText, "reduce A -> a");
    EXPECT_EQ(conflict.IncomingText, "reduce B -> a");
}

TEST(Slr1TablesTest, AcceptReduceConflict) {
    TAnalysis analysis({"S -> S a"});
    auto result = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Conflict>(result));
    const auto& conflict = std::get<TSlr1Conflict>(result);

    EXPECT_EQ(conflict.Kind, EConflictKind::ReduceReduce);
    EXPECT_EQ(conflict.Lookahead, TSymbol::EndMarker());
    EXPECT_EQ(conflict.Existing, TAction::Accept());
    EXPECT_EQ(conflict.Incoming, TAction::Reduce(0));
    EXPECT_EQ(conflict.ExistingText, "accept");
}

TEST(Slr1TablesTest, RepeatedProductionIsNotAConflict) {
    TAnalysis analysis({"S -> a a"});
    auto result = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(result));
    EXPECT_TRUE(std::get<TSlr1Tables>(result).Parse("a"));
}

TEST(Slr1TablesTest, BuildIsDeterministic) {
    TAnalysis analysis({"S -> S+S S*S i"});
    auto first = analysis.BuildSlr1();
    auto second = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Conflict>(first));
    ASSERT_TRUE(std::holds_alternative<TSlr1Conflict>(second));
    EXPECT_EQ(std::get<TSlr1Conflict>(first).ToString(), std::get<TSlr1Conflict>(second).ToString());

    TAnalysis arithmetic(ARITHMETIC);
    auto lhs = arithmetic.BuildSlr1();
    auto rhs = arithmetic.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(lhs));
    ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(rhs));
    EXPECT_EQ(std::get<TSlr1Tables>(lhs).GetActionTable().Size(), std::get<TSlr1Tables>(rhs).GetActionTable().Size());
    EXPECT_EQ(std::get<TSlr1Tables>(lhs).GetGotoTable().Size(), std::get<TSlr1Tables>(rhs).GetGotoTable().Size());
}
