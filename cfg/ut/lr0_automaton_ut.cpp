#include <cfg/lr0_automaton.h>
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

TEST(Lr0AutomatonTest, ArithmeticGrammar) {
    TLr0Automaton automaton(TGrammar::FromLines(ARITHMETIC));

    EXPECT_EQ(automaton.StateCount(), 12u);
    EXPECT_EQ(automaton.GetRules().size(), 7u);
    EXPECT_EQ(automaton.GetAugmentedRuleId(), 6u);
    EXPECT_EQ(automaton.GetRules().back().ToString(), "' -> S");

    EXPECT_EQ(automaton.GetStates()[0].size(), 7u);
    const std::vector<TLr0Item> kernel = {TLr0Item{6, 0}};
    EXPECT_EQ(automaton.Kernel(0), kernel);

    // Terminals are shifted before nonterminals, both in character order.
    EXPECT_EQ(automaton.GetTransition(0, Term('(')), 1u);
    EXPECT_EQ(automaton.GetTransition(0, Term('i')), 2u);
    EXPECT_FALSE(automaton.GetTransition(0, Term('+')));
    EXPECT_FALSE(automaton.GetTransition(0, TSymbol::EndMarker()));

    const auto transitions = automaton.GetTransitions(0);
    ASSERT_EQ(transitions.size(), 5u);
    EXPECT_EQ(transitions[0].first, Term('('));
    EXPECT_EQ(transitions[1].first, Term('i'));
    EXPECT_EQ(transitions[2].first, NonTerm('F'));
    EXPECT_EQ(transitions[3].first, NonTerm('S'));
    EXPECT_EQ(transitions[4].first, NonTerm('T'));
}

TEST(Lr0AutomatonTest, StatesAreDistinct) {
    TLr0Automaton automaton(TGrammar::FromLines(ARITHMETIC));
    const auto& states = automaton.GetStates();
    for (size_t i = 0; i < states.size(); ++i) {
        EXPECT_FALSE(states[i].empty());
        for (size_t j = i + 1; j < states.size(); ++j) {
            EXPECT_NE(states[i], states[j]) << "states " << i << " and " << j;
        }
    }
}

TEST(Lr0AutomatonTest, TransitionsFollowGoTo) {
    TLr0Automaton automaton(TGrammar::FromLines(ARITHMETIC));
    for (TState state = 0; state < automaton.StateCount(); ++state) {
        for (const auto& [symbol, target] : automaton.GetTransitions(state)) {
            EXPECT_EQ(automaton.GoTo(automaton.GetStates()[state], symbol), automaton.GetStates()[target]);
        }
    }
}

TEST(Lr0AutomatonTest, AcceptState) {
    TLr0Automaton automaton(TGrammar::FromLines(ARITHMETIC));
    auto state = automaton.GetTransition(0, NonTerm('S'));
    ASSERT_TRUE(state);

    const std::vector<TLr0Item> kernel = {TLr0Item{0, 1}, TLr0Item{6, 1}};
    EXPECT_EQ(automaton.Kernel(*state), kernel);
    EXPECT_TRUE(automaton.IsComplete(TLr0Item{6, 1}));
    EXPECT_EQ(automaton.ToString(TLr0Item{0, 1}), "S -> S.+T");
    EXPECT_EQ(automaton.ToString(TLr0Item{6, 1}), "' -> S.");
}

TEST(Lr0AutomatonTest, GoToWithoutMoves) {
    TLr0Automaton automaton(TGrammar::FromLines(ARITHMETIC));
    EXPECT_TRUE(automaton.GoTo(automaton.GetStates()[0], Term('+')).empty());
    EXPECT_TRUE(automaton.GoTo({}, NonTerm('S')).empty());
}

TEST(Lr0AutomatonTest, ClosureAddsStartItemsOnce) {
    TLr0Automaton automaton(TGrammar::FromLines(ARITHMETIC));
    // [T -> T*.F] brings F -> .(S) and F -> .i
    const auto closure = automaton.Closure({TLr0Item{2, 2}});
    const TLr0ItemSet expected = {TLr0Item{2, 2}, TLr0Item{4, 0}, TLr0Item{5, 0}};
    EXPECT_EQ(closure, expected);
}

TEST(Lr0AutomatonTest, EpsilonItemIsComplete) {
    TLr0Automaton automaton(TGrammar::FromLines({"S -> AB", "A -> a e", "B -> b"}));

    const TLr0Item epsilonItem{2, 0};
    EXPECT_TRUE(automaton.IsComplete(epsilonItem));
    EXPECT_FALSE(automaton.SymbolAfterDot(epsilonItem));
    EXPECT_EQ(automaton.ToString(epsilonItem), "A -> .");
    EXPECT_TRUE(automaton.GetStates()[0].count(epsilonItem));

    EXPECT_EQ(automaton.SymbolAfterDot(TLr0Item{0, 1}), NonTerm('B'));
    EXPECT_FALSE(automaton.GetTransition(0, Term('b')));
}
