#include <cfg/ll1_table.h>
#include <cfg/slr1_tables.h>
#include <gtest/gtest.h>
#include "utils.h"

using namespace NCfg;

namespace {
    /// Both parsers of a grammar that is LL(1) and SLR(1) accept every sentence it derives.
    void CheckDerivedSentences(const std::vector<std::string>& lines, size_t maxSteps) {
        TAnalysis analysis(lines);
        auto ll1 = analysis.BuildLL1();
        auto slr1 = analysis.BuildSlr1();
        ASSERT_TRUE(std::holds_alternative<TLL1Table>(ll1));
        ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(slr1));

        const std::vector<const IRecognizer*> recognizers = {&std::get<TLL1Table>(ll1), &std::get<TSlr1Tables>(slr1)};
        const auto sentences = EnumerateSentences(analysis.Grammar, maxSteps);
        ASSERT_FALSE(sentences.empty());

        for (const auto* recognizer : recognizers) {
            for (const auto& sentence : sentences) {
                EXPECT_TRUE(recognizer->Parse(sentence)) << sentence;
                EXPECT_FALSE(recognizer->Parse(sentence + "#")) << sentence;
                EXPECT_FALSE(recognizer->Parse("#" + sentence)) << sentence;
            }
        }
    }
}

TEST(RecognizerTest, InputSymbols) {
    const std::vector<TSymbol> expected = {Term('a'), Term('B'), Term('e'), Term('$'), TSymbol::EndMarker()};
    EXPECT_EQ(ToInputSymbols("aBe$"), expected);
    EXPECT_EQ(ToInputSymbols(""), std::vector<TSymbol>{TSymbol::EndMarker()});
}

TEST(RecognizerTest, ExpressionSentences) {
    CheckDerivedSentences({"S -> TX", "X -> +TX e", "T -> FY", "Y -> *FY e", "F -> (S) i"}, 14);
}

TEST(RecognizerTest, ParenthesesSentences) {
    CheckDerivedSentences({"S -> (S)S e"}, 8);
}

TEST(RecognizerTest, NullablePrefixSentences) {
    CheckDerivedSentences({"S -> AB", "A -> a e", "B -> bB c"}, 8);
}

TEST(RecognizerTest, DriversAgree) {
    TAnalysis analysis({"S -> aSb c"});
    auto ll1 = analysis.BuildLL1();
    auto slr1 = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TLL1Table>(ll1));
    ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(slr1));

    for (const std::string input : {"", "c", "acb", "aacbb", "aacb", "acbb", "ab", "cc", "aaacbbb"}) {
        EXPECT_EQ(std::get<TLL1Table>(ll1).Parse(input), std::get<TSlr1Tables>(slr1).Parse(input)) << input;
    }
    EXPECT_TRUE(std::get<TLL1Table>(ll1).Parse("aaacbbb"));
    EXPECT_FALSE(std::get<TSlr1Tables>(slr1).Parse("aacb"));
}
