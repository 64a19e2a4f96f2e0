#include "table_printer.h"

#include <algorithm>

namespace {
    using namespace NCfg;

    std::vector<TSymbol> SortedNonTerminals(const TGrammar& grammar) {
        auto result = grammar.GetNonTerminals();
        std::sort(result.begin(), result.end());
        return result;
    }

    /// Terminals followed by the end marker.
    std::vector<TSymbol> LookaheadColumns(const TGrammar& grammar) {
        auto result = grammar.GetTerminals();
        std::sort(result.begin(), result.end());
        result.push_back(TSymbol::EndMarker());
        return result;
    }

    std::string Pad(const std::string& s, size_t width) {
        return s.size() < width ? s + std::string(width - s.size(), ' ') : s;
    }

    std::vector<std::string> ToKeys(const std::vector<TSymbol>& symbols) {
        std::vector<std::string> result;
        for (const auto& symbol : symbols) {
            result.push_back(symbol.ToString());
        }
        return result;
    }

    std::vector<std::string> StateKeys(size_t stateCount) {
        std::vector<std::string> result;
        for (TState state = 0; state < stateCount; ++state) {
            result.push_back(std::to_string(state));
        }
        return result;
    }

    void PrintSets(std::ostream& out, const std::string& name, const std::vector<TSymbol>& nonTerminals, const std::unordered_map<TSymbol, TSymbolSet>& sets) {
        for (const auto& nonTerminal : nonTerminals) {
            auto it = sets.find(nonTerminal);
            out << name << "(" << nonTerminal.ToString() << ") = " << (it != sets.end() ? ToString(it->second) : "{}") << "\n";
        }
    }
}

namespace NCfg {
    TTextTable::TTextTable(std::vector<std::string> rowKeys, std::vector<std::string> columnKeys)
        : Content(rowKeys.size(), std::vector<std::string>(columnKeys.size()))
        , RowKeys(std::move(rowKeys))
        , ColumnKeys(std::move(columnKeys))
    {}

    void TTextTable::Set(size_t row, size_t column, std::string value) {
        Content.at(row).at(column) = std::move(value);
    }

    void TTextTable::Print(std::ostream& out) const {
        size_t keyWidth = 0;
        for (const auto& key : RowKeys) {
            keyWidth = std::max(keyWidth, key.size());
        }

        std::vector<size_t> widths;
        for (const auto& key : ColumnKeys) {
            widths.push_back(key.size());
        }
        for (const auto& row : Content) {
            for (size_t column = 0; column < row.size(); ++column) {
                widths[column] = std::max(widths[column], row[column].size());
            }
        }

        size_t ruleWidth = keyWidth + 1;
        for (auto width : widths) {
            ruleWidth += width + 3;
        }
        const std::string rule(ruleWidth, '_');

        auto printRow = [&](const std::string& key, const std::vector<std::string>& cells) {
            out << Pad(key, keyWidth);
            for (size_t column = 0; column < cells.size(); ++column) {
                out << " | " << Pad(cells[column], widths[column]);
            }
            out << "\n" << rule << "\n";
        };

        printRow("", ColumnKeys);
        for (size_t row = 0; row < RowKeys.size(); ++row) {
            printRow(RowKeys[row], Content[row]);
        }
    }

    void PrintFirstSets(std::ostream& out, const TGrammar& grammar, const TFirstMap& first) {
        PrintSets(out, "FIRST", SortedNonTerminals(grammar), first);
    }

    void PrintFollowSets(std::ostream& out, const TGrammar& grammar, const TFollowMap& follow) {
        PrintSets(out, "FOLLOW", SortedNonTerminals(grammar), follow);
    }

    void PrintLL1Table(std::ostream& out, const TLL1Table& table) {
        const auto& grammar = table.GetGrammar();
        const auto nonTerminals = SortedNonTerminals(grammar);
        const auto lookaheads = LookaheadColumns(grammar);

        TTextTable textTable(ToKeys(nonTerminals), ToKeys(lookaheads));
        for (size_t row = 0; row < nonTerminals.size(); ++row) {
            for (size_t col = 0; col < lookaheads.size(); ++col) {
                if (auto ruleId = table.GetRuleId(nonTerminals[row], lookaheads[col])) {
                    textTable.Set(row, col, grammar.GetProduction(*ruleId).ToString());
                }
            }
        }

        out << "LL(1) table:\n";
        textTable.Print(out);
    }

    void PrintStates(std::ostream& out, const TLr0Automaton& automaton) {
        for (TState state = 0; state < automaton.StateCount(); ++state) {
            out << "State " << state << ":\n";
            for (const auto& item : automaton.SortedItems(state)) {
                out << "    " << automaton.ToString(item) << "\n";
            }
            for (const auto& [symbol, target] : automaton.GetTransitions(state)) {
                out << "    on " << symbol.ToString() << " -> " << target << "\n";
            }
        }
    }

    void PrintActionTable(std::ostream& out, const TSlr1Tables& tables) {
        const auto& automaton = tables.GetAutomaton();
        const auto lookaheads = LookaheadColumns(automaton.GetGrammar());

        TTextTable textTable(StateKeys(automaton.StateCount()), ToKeys(lookaheads));
        for (TState state = 0; state < automaton.StateCount(); ++state) {
            for (size_t col = 0; col < lookaheads.size(); ++col) {
                if (auto action = tables.GetActionTable().GetAction(state, lookaheads[col])) {
                    textTable.Set(state, col, action->ToString());
                }
            }
        }

        out << "Action table:\n";
        textTable.Print(out);
    }

    void PrintGotoTable(std::ostream& out, const TSlr1Tables& tables) {
        const auto& automaton = tables.GetAutomaton();
        const auto nonTerminals = SortedNonTerminals(automaton.GetGrammar());

        TTextTable textTable(StateKeys(automaton.StateCount()), ToKeys(nonTerminals));
        for (TState state = 0; state < automaton.StateCount(); ++state) {
            for (size_t col = 0; col < nonTerminals.size(); ++col) {
                if (auto target = tables.GetGotoTable().GetState(state, nonTerminals[col])) {
                    textTable.Set(state, col, std::to_string(*target));
                }
            }
        }

        out << "\nGoto table:\n";
        textTable.Print(out);
    }
}
