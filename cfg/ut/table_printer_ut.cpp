#include <cfg/table_printer.h>
#include <gtest/gtest.h>
#include "utils.h"

#include <sstream>

using namespace NCfg;

namespace {
    const std::vector<std::string> NULLABLE_PREFIX = {"S -> AB", "A -> a e", "B -> b"};
}

TEST(TablePrinterTest, TextTable) {
    TTextTable table({"0"}, {"a"});
    table.Set(0, 0, "s1");

    std::stringstream ss;
    table.Print(ss);
    EXPECT_EQ(ss.str(), "  | a \n_______\n0 | s1\n_______\n");

    EXPECT_THROW(table.Set(1, 0, "s2"), std::out_of_range);
}

TEST(TablePrinterTest, TextTableColumnWidths) {
    TTextTable table({"0", "10"}, {"a", "B"});
    table.Set(0, 0, "s1");
    table.Set(1, 1, "S -> x");

    std::stringstream ss;
    table.Print(ss);
    const std::string rule(17, '_');
    EXPECT_EQ(ss.str(),
        "   | a  | B     \n" + rule + "\n"
        "0  | s1 |       \n" + rule + "\n"
        "10 |    | S -> x\n" + rule + "\n");
}

TEST(TablePrinterTest, Sets) {
    TAnalysis analysis(NULLABLE_PREFIX);

    std::stringstream first;
    PrintFirstSets(first, analysis.Grammar, analysis.First);
    EXPECT_EQ(first.str(), "FIRST(A) = {e, a}\nFIRST(B) = {b}\nFIRST(S) = {a, b}\n");

    std::stringstream follow;
    PrintFollowSets(follow, analysis.Grammar, analysis.Follow);
    EXPECT_EQ(follow.str(), "FOLLOW(A) = {b}\nFOLLOW(B) = {$}\nFOLLOW(S) = {$}\n");
}

TEST(TablePrinterTest, LL1Table) {
    TAnalysis analysis(NULLABLE_PREFIX);
    auto result = analysis.BuildLL1();
    ASSERT_TRUE(std::holds_alternative<TLL1Table>(result));

    std::stringstream ss;
    PrintLL1Table(ss, std::get<TLL1Table>(result));
    const auto text = ss.str();
    EXPECT_EQ(text.rfind("LL(1) table:\n", 0), 0u);
    EXPECT_NE(text.find("A -> e"), std::string::npos);
    EXPECT_NE(text.find("S -> AB"), std::string::npos);
}

TEST(TablePrinterTest, States) {
    TAnalysis analysis(NULLABLE_PREFIX);
    TLr0Automaton automaton(analysis.Grammar);

    std::stringstream ss;
    PrintStates(ss, automaton);
    const auto text = ss.str();
    EXPECT_EQ(text.rfind(
        "State 0:\n"
        "    S -> .AB\n"
        "    A -> .a\n"
        "    A -> .\n"
        "    ' -> .S\n"
        "    on a -> 1\n"
        "    on A -> 2\n"
        "    on S -> 3\n"
        "State 1:\n", 0), 0u);
}

TEST(TablePrinterTest, Slr1Tables) {
    TAnalysis analysis(NULLABLE_PREFIX);
    auto result = analysis.BuildSlr1();
    ASSERT_TRUE(std::holds_alternative<TSlr1Tables>(result));
    const auto& tables = std::get<TSlr1Tables>(result);

    std::stringstream actions;
    PrintActionTable(actions, tables);
    EXPECT_EQ(actions.str().rfind("Action table:\n", 0), 0u);
    EXPECT_NE(actions.str().find("acc"), std::string::npos);
    EXPECT_NE(actions.str().find("r2"), std::string::npos);

    std::stringstream gotos;
    PrintGotoTable(gotos, tables);
    EXPECT_EQ(gotos.str().rfind("\nGoto table:\n", 0), 0u);
}
