#include "ll1_table.h"

#include <sstream>

namespace NCfg {
    std::string TLL1Conflict::ToString() const {
        std::stringstream ss;
        ss << "Conflict at M[" << NonTerminal.ToString() << ", " << Lookahead.ToString() << "]: "
           << Existing.ToString() << " / " << Incoming.ToString();
        return ss.str();
    }

    std::variant<TLL1Table, TLL1Conflict> TLL1Table::Build(const TGrammar& grammar, const TFirstMap& first, const TFollowMap& follow) {
        TLL1Table table(grammar);

        const auto& productions = grammar.GetProductions();
        for (size_t ruleId = 0; ruleId < productions.size(); ++ruleId) {
            const auto& production = productions[ruleId];
            auto rightFirst = FirstOfString(production.Right, first);

            for (const auto& lookahead : Sorted(rightFirst)) {
                if (lookahead.IsEpsilon()) {
                    continue;
                }
                if (auto conflict = table.AddEntry(production.Left, lookahead, ruleId)) {
                    return *conflict;
                }
            }

            if (!rightFirst.count(TSymbol::Epsilon())) {
                continue;
            }
            auto it = follow.find(production.Left);
            if (it == follow.end()) {
                continue;
            }
            for (const auto& lookahead : Sorted(it->second)) {
                if (auto conflict = table.AddEntry(production.Left, lookahead, ruleId)) {
                    return *conflict;
                }
            }
        }

        return table;
    }

    std::optional<TLL1Conflict> TLL1Table::AddEntry(const TSymbol& nonTerminal, const TSymbol& lookahead, size_t ruleId) {
        auto [it, inserted] = Table[nonTerminal].try_emplace(lookahead, ruleId);
        if (inserted) {
            return std::nullopt;
        }
        const auto& existing = Grammar.GetProduction(it->second);
        const auto& incoming = Grammar.GetProduction(ruleId);
        if (existing == incoming) {
            return std::nullopt;
        }
        return TLL1Conflict{nonTerminal, lookahead, existing, incoming};
    }

    std::optional<size_t> TLL1Table::GetRuleId(const TSymbol& nonTerminal, const TSymbol& lookahead) const {
        auto itNonTerminal = Table.find(nonTerminal);
        if (itNonTerminal == Table.end()) {
            return std::nullopt;
        }
        auto it = itNonTerminal->second.find(lookahead);
        if (it == itNonTerminal->second.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t TLL1Table::Size() const {
        size_t result = 0;
        for (const auto& [nonTerminal, row] : Table) {
            result += row.size();
        }
        return result;
    }

    bool TLL1Table::Parse(const std::string& input) const {
        const auto symbols = ToInputSymbols(input);
        std::vector<TSymbol> stack = {TSymbol::EndMarker(), Grammar.GetStart()};
        size_t cursor = 0;

        while (!stack.empty()) {
            if (cursor >= symbols.size()) {
                return false;
            }
            const auto top = stack.back();
            const auto& current = symbols[cursor];

            if (top == current) {
                stack.pop_back();
                ++cursor;
                continue;
            }

            if (!top.IsNonTerminal()) {
                return false;
            }

            auto ruleId = GetRuleId(top, current);
            if (!ruleId) {
                return false;
            }
            stack.pop_back();
            const auto& production = Grammar.GetProduction(*ruleId);
            if (!production.IsEpsilon()) {
                stack.insert(stack.end(), production.Right.rbegin(), production.Right.rend());
            }
        }

        return cursor == symbols.size();
    }
}
