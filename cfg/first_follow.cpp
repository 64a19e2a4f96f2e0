#include "first_follow.h"

namespace {
    using namespace NCfg;

    /// Nonterminals of the left-hand sides followed by those used only on right-hand sides.
    std::vector<TSymbol> CollectNonTerminals(const TGrammar& grammar) {
        std::vector<TSymbol> result = grammar.GetNonTerminals();
        TSymbolSet seen(result.begin(), result.end());
        for (const auto& production : grammar.GetProductions()) {
            for (const auto& symbol : production.Right) {
                if (symbol.IsNonTerminal() && seen.insert(symbol).second) {
                    result.push_back(symbol);
                }
            }
        }
        return result;
    }

    /// Returns true if target grew.
    bool Unite(TSymbolSet& target, const TSymbolSet& source) {
        const auto oldSize = target.size();
        target.insert(source.begin(), source.end());
        return target.size() > oldSize;
    }
}

namespace NCfg {
    TSymbolSet FirstOfString(const std::vector<TSymbol>& seq, const TFirstMap& first) {
        static const TSymbolSet empty = {};

        TSymbolSet result;
        bool derivedEmpty = true;
        for (const auto& symbol : seq) {
            auto it = first.find(symbol);
            const auto& symbolFirst = it != first.end() ? it->second : empty;
            bool hasEmpty = false;
            for (const auto& s : symbolFirst) {
                if (s.IsEpsilon()) {
                    hasEmpty = true;
                    continue;
                }
                result.insert(s);
            }
            if (!hasEmpty) {
                derivedEmpty = false;
                break;
            }
        }

        if (derivedEmpty) {
            result.insert(TSymbol::Epsilon());
        }

        return result;
    }

    TFirstMap ComputeFirst(const TGrammar& grammar) {
        TFirstMap first;
        for (const auto& terminal : grammar.GetTerminals()) {
            first[terminal] = {terminal};
        }
        first[TSymbol::Epsilon()] = {TSymbol::Epsilon()};
        first[TSymbol::EndMarker()] = {TSymbol::EndMarker()};
        for (const auto& nonTerminal : CollectNonTerminals(grammar)) {
            first[nonTerminal] = {};
        }

        while (true) {
            bool added = false;
            for (const auto& production : grammar.GetProductions()) {
                auto rightFirst = FirstOfString(production.Right, first);
                if (Unite(first[production.Left], rightFirst)) {
                    added = true;
                }
            }
            if (!added) {
                break;
            }
        }

        return first;
    }

    TFollowMap ComputeFollow(const TGrammar& grammar, const TFirstMap& first) {
        TFollowMap follow;
        for (const auto& nonTerminal : CollectNonTerminals(grammar)) {
            follow[nonTerminal] = {};
        }
        follow[grammar.GetStart()].insert(TSymbol::EndMarker());

        while (true) {
            bool added = false;
            for (const auto& production : grammar.GetProductions()) {
                const auto& right = production.Right;
                for (size_t i = 0; i < right.size(); ++i) {
                    if (!right[i].IsNonTerminal()) {
                        continue;
                    }
                    std::vector<TSymbol> beta(right.begin() + i + 1, right.end());
                    auto betaFirst = FirstOfString(beta, first);

                    auto& targetFollow = follow[right[i]];
                    const bool betaNullable = betaFirst.erase(TSymbol::Epsilon()) > 0;
                    if (Unite(targetFollow, betaFirst)) {
                        added = true;
                    }
                    if (betaNullable) {
                        // Copy: the source may be the target itself (A -> aA).
                        const TSymbolSet leftFollow = follow[production.Left];
                        if (Unite(targetFollow, leftFollow)) {
                            added = true;
                        }
                    }
                }
            }
            if (!added) {
                break;
            }
        }

        return follow;
    }
}
