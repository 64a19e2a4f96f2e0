#pragma once

#include "first_follow.h"
#include "grammar.h"
#include "ll1_table.h"
#include "lr0_automaton.h"
#include "slr1_tables.h"

#include <ostream>
#include <string>
#include <vector>

namespace NCfg {
    /// Column-aligned text grid.
    class TTextTable {
    public:
        TTextTable(std::vector<std::string> rowKeys, std::vector<std::string> columnKeys);

        void Set(size_t row, size_t column, std::string value);

        void Print(std::ostream& out) const;

    private:
        std::vector<std::vector<std::string>> Content;
        std::vector<std::string> RowKeys;
        std::vector<std::string> ColumnKeys;
    };

    // All printers list symbols in the symbol order, so output is reproducible.

    void PrintFirstSets(std::ostream& out, const TGrammar& grammar, const TFirstMap& first);

    void PrintFollowSets(std::ostream& out, const TGrammar& grammar, const TFollowMap& follow);

    void PrintLL1Table(std::ostream& out, const TLL1Table& table);

    void PrintStates(std::ostream& out, const TLr0Automaton& automaton);

    void PrintActionTable(std::ostream& out, const TSlr1Tables& tables);

    void PrintGotoTable(std::ostream& out, const TSlr1Tables& tables);
}
