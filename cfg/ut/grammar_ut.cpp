#include <cfg/grammar.h>
#include <gtest/gtest.h>
#include "utils.h"

using namespace NCfg;

TEST(GrammarTest, FromLines) {
    auto grammar = TGrammar::FromLines({
        "S -> S+T T",
        "T -> T*F F",
        "F -> (S) i"
    });

    ASSERT_EQ(grammar.GetProductions().size(), 6);
    EXPECT_EQ(grammar.GetStart(), NonTerm('S'));
    EXPECT_EQ(grammar.GetNonTerminals(), (std::vector<TSymbol>{NonTerm('S'), NonTerm('T'), NonTerm('F')}));
    EXPECT_EQ(grammar.GetTerminals(), (std::vector<TSymbol>{Term('+'), Term('*'), Term('('), Term(')'), Term('i')}));

    const auto& first = grammar.GetProduction(0);
    EXPECT_EQ(first.Left, NonTerm('S'));
    EXPECT_EQ(first.Right, (std::vector<TSymbol>{NonTerm('S'), Term('+'), NonTerm('T')}));
    EXPECT_EQ(first.ToString(), "S -> S+T");

    EXPECT_EQ(grammar.FindRules(NonTerm('T')), (std::vector<size_t>{2, 3}));
    auto fProductions = grammar.ProductionsOf(NonTerm('F'));
    ASSERT_EQ(fProductions.size(), 2);
    EXPECT_EQ(fProductions[0].ToString(), "F -> (S)");
    EXPECT_EQ(fProductions[1].ToString(), "F -> i");
}

TEST(GrammarTest, UnknownNonTerminalHasNoProductions) {
    auto grammar = TGrammar::FromLines({"S -> aB"});
    EXPECT_TRUE(grammar.ProductionsOf(NonTerm('B')).empty());
    EXPECT_TRUE(grammar.FindRules(Term('a')).empty());
    EXPECT_EQ(grammar.GetNonTerminals(), (std::vector<TSymbol>{NonTerm('S')}));
}

TEST(GrammarTest, EpsilonAlternatives) {
    auto grammar = TGrammar::FromLines({
        "S -> AB",
        "A -> a e",
        "B -> b"
    });

    auto aProductions = grammar.ProductionsOf(NonTerm('A'));
    ASSERT_EQ(aProductions.size(), 2);
    EXPECT_FALSE(aProductions[0].IsEpsilon());
    EXPECT_TRUE(aProductions[1].IsEpsilon());
    EXPECT_EQ(aProductions[1].Length(), 0);
    EXPECT_EQ(aProductions[1].ToString(), "A -> e");
    EXPECT_EQ(grammar.GetTerminals(), (std::vector<TSymbol>{Term('a'), Term('b')}));
}

TEST(GrammarTest, EpsilonInsideAlternativeIsDropped) {
    auto grammar = TGrammar::FromLines({"S -> aeb ee"});
    ASSERT_EQ(grammar.GetProductions().size(), 2);
    EXPECT_EQ(grammar.GetProduction(0).Right, (std::vector<TSymbol>{Term('a'), Term('b')}));
    EXPECT_TRUE(grammar.GetProduction(1).IsEpsilon());
}

TEST(GrammarTest, SeparatorSpacing) {
    auto grammar = TGrammar::FromLines({"S->aS  b", "  A   ->   x  "});
    ASSERT_EQ(grammar.GetProductions().size(), 3);
    EXPECT_EQ(grammar.GetProduction(1).ToString(), "S -> b");
    EXPECT_EQ(grammar.GetProduction(2).ToString(), "A -> x");
}

TEST(GrammarTest, AlternativeMayContainArrowCharacters) {
    auto grammar = TGrammar::FromLines({"S -> a->b"});
    ASSERT_EQ(grammar.GetProductions().size(), 1);
    EXPECT_EQ(grammar.GetProduction(0).Right, (std::vector<TSymbol>{Term('a'), Term('-'), Term('>'), Term('b')}));
}

TEST(GrammarTest, FormatErrors) {
    EXPECT_THROW(TGrammar::FromLines({"S a b"}), TFormatError);
    EXPECT_THROW(TGrammar::FromLines({"S = a"}), TFormatError);
    EXPECT_THROW(TGrammar::FromLines({"-> a"}), TFormatError);
    EXPECT_THROW(TGrammar::FromLines({"SA -> a"}), TFormatError);
    EXPECT_THROW(TGrammar::FromLines({"a -> b"}), TFormatError);
    EXPECT_THROW(TGrammar::FromLines({"S ->"}), TFormatError);
    EXPECT_THROW(TGrammar::FromLines({"S -> a$"}), TFormatError);
    EXPECT_THROW(TGrammar::FromLines({"S -> a -> b"}), TFormatError);
    EXPECT_THROW(TGrammar::FromLines({"S -> ->"}), TFormatError);
    EXPECT_THROW(TGrammar::FromCountedLines({"1", "S -> a -> b"}), TFormatError);
}

TEST(GrammarTest, StartSymbolMustHaveProductions) {
    EXPECT_THROW(TGrammar::FromLines({}), TFormatError);
    EXPECT_THROW(TGrammar::FromLines({"A -> a"}), TFormatError);
    const std::vector<TProduction> none;
    EXPECT_THROW(TGrammar{none}, TFormatError);
}

TEST(GrammarTest, ProductionsAreValidated) {
    using TProductions = std::vector<TProduction>;
    EXPECT_THROW(TGrammar(TProductions{TProduction{Term('a'), {Term('b')}}}), TFormatError);
    EXPECT_THROW(TGrammar(TProductions{TProduction{NonTerm('S'), {}}}), TFormatError);
    EXPECT_THROW(TGrammar(TProductions{TProduction{NonTerm('S'), {Term('a'), TSymbol::Epsilon()}}}), TFormatError);
    EXPECT_NO_THROW(TGrammar(TProductions{TProduction{NonTerm('S'), {TSymbol::Epsilon()}}}));
}

TEST(GrammarTest, FromCountedLines) {
    auto grammar = TGrammar::FromCountedLines({"2", "S -> aA", "A -> b e"});
    EXPECT_EQ(grammar.GetProductions().size(), 3);
    EXPECT_EQ(grammar.ToString(), "S -> aA\nA -> b\nA -> e\n");

    EXPECT_EQ(TGrammar::ParseProductionCount(" 3 "), 3);
    EXPECT_THROW(TGrammar::ParseProductionCount("three"), TFormatError);
    EXPECT_THROW(TGrammar::ParseProductionCount("-1"), TFormatError);
}

TEST(GrammarTest, CountedLinesErrors) {
    EXPECT_THROW(TGrammar::FromCountedLines({}), TFormatError);
    EXPECT_THROW(TGrammar::FromCountedLines({"0"}), TFormatError);
    EXPECT_THROW(TGrammar::FromCountedLines({"x", "S -> a"}), TFormatError);
    EXPECT_THROW(TGrammar::FromCountedLines({"2", "S -> a"}), TFormatError);
    EXPECT_THROW(TGrammar::FromCountedLines({"1", "S -> a", "A -> b"}), TFormatError);
}
