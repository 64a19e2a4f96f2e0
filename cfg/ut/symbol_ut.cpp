#include <cfg/symbol.h>
#include <gtest/gtest.h>
#include "utils.h"

using namespace NCfg;

TEST(SymbolTest, Classify) {
    EXPECT_EQ(TSymbol::Classify('S'), NonTerm('S'));
    EXPECT_EQ(TSymbol::Classify('Z'), NonTerm('Z'));
    EXPECT_EQ(TSymbol::Classify('e'), TSymbol::Epsilon());
    EXPECT_EQ(TSymbol::Classify('$'), TSymbol::EndMarker());
    EXPECT_EQ(TSymbol::Classify('a'), Term('a'));
    EXPECT_EQ(TSymbol::Classify('+'), Term('+'));
    EXPECT_EQ(TSymbol::Classify('('), Term('('));
    EXPECT_EQ(TSymbol::Classify('1'), Term('1'));

    EXPECT_TRUE(TSymbol::Classify('A').IsNonTerminal());
    EXPECT_TRUE(TSymbol::Classify('e').IsEpsilon());
    EXPECT_TRUE(TSymbol::Classify('$').IsEndMarker());
    EXPECT_TRUE(TSymbol::Classify('i').IsTerminal());
}

TEST(SymbolTest, EqualityIsByKindAndValue) {
    EXPECT_NE(Term('a'), NonTerm('a'));
    EXPECT_NE(Term('e'), TSymbol::Epsilon());
    EXPECT_NE(Term('$'), TSymbol::EndMarker());
    EXPECT_EQ(TSymbol::Epsilon(), TSymbol::Epsilon());

    TSymbolSet symbols = {Term('a'), NonTerm('a'), Term('a')};
    EXPECT_EQ(symbols.size(), 2);
}

TEST(SymbolTest, Order) {
    EXPECT_LT(TSymbol::Epsilon(), Term('!'));
    EXPECT_LT(Term('z'), NonTerm('A'));
    EXPECT_LT(NonTerm('Z'), TSymbol::EndMarker());
    EXPECT_LT(Term('a'), Term('b'));
    EXPECT_LT(NonTerm('A'), NonTerm('S'));
    EXPECT_FALSE(TSymbol::EndMarker() < TSymbol::EndMarker());
}

TEST(SymbolTest, SetToString) {
    EXPECT_EQ(ToString(TSymbolSet{}), "{}");
    EXPECT_EQ(ToString(Set("$ba")), "{a, b, $}");
    EXPECT_EQ(ToString(Set("ae")), "{e, a}");
    EXPECT_EQ(NonTerm('S').ToString(), "S");
}
