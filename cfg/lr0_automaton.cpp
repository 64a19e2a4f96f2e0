#include "lr0_automaton.h"

#include <algorithm>
#include <queue>
#include <set>
#include <sstream>
#include <stdexcept>

namespace NCfg {
    TLr0Automaton::TLr0Automaton(const TGrammar& grammar)
        : Grammar(grammar)
        , Rules(grammar.GetProductions())
    {
        Rules.push_back({AugmentedStart(), {Grammar.GetStart()}});

        const TLr0ItemSet startItems = {TLr0Item{GetAugmentedRuleId(), 0}};
        States.push_back(Closure(startItems));

        std::queue<TState> worklist;
        worklist.push(0);
        while (!worklist.empty()) {
            const auto state = worklist.front();
            worklist.pop();
            const auto current = States[state];

            std::set<TSymbol> symbols;
            for (const auto& item : current) {
                if (auto symbol = SymbolAfterDot(item)) {
                    symbols.insert(*symbol);
                }
            }

            for (const auto& symbol : symbols) {
                auto nextSet = GoTo(current, symbol);
                if (nextSet.empty()) {
                    continue;
                }
                auto it = std::find(States.begin(), States.end(), nextSet);
                TState target = it - States.begin();
                if (it == States.end()) {
                    States.push_back(std::move(nextSet));
                    worklist.push(target);
                }
                Transitions[state][symbol] = target;
            }
        }
    }

    std::optional<TState> TLr0Automaton::GetTransition(TState state, const TSymbol& symbol) const {
        auto itState = Transitions.find(state);
        if (itState == Transitions.end()) {
            return std::nullopt;
        }
        auto it = itState->second.find(symbol);
        if (it == itState->second.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::pair<TSymbol, TState>> TLr0Automaton::GetTransitions(TState state) const {
        std::vector<std::pair<TSymbol, TState>> result;
        auto itState = Transitions.find(state);
        if (itState != Transitions.end()) {
            result.assign(itState->second.begin(), itState->second.end());
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    std::optional<TSymbol> TLr0Automaton::SymbolAfterDot(const TLr0Item& item) const {
        const auto& rule = Rules.at(item.RuleId);
        if (item.Dot < rule.Length()) {
            return rule.Right[item.Dot];
        }
        return std::nullopt;
    }

    TLr0ItemSet TLr0Automaton::Closure(const TLr0ItemSet& items) const {
        TLr0ItemSet result(items);
        std::vector<TLr0Item> pending(items.begin(), items.end());

        while (!pending.empty()) {
            auto item = pending.back();
            pending.pop_back();
            auto symbol = SymbolAfterDot(item);
            if (!symbol || !symbol->IsNonTerminal()) {
                continue;
            }
            for (auto ruleId : Grammar.FindRules(*symbol)) {
                TLr0Item newItem{ruleId, 0};
                if (result.insert(newItem).second) {
                    pending.push_back(newItem);
                }
            }
        }

        return result;
    }

    TLr0ItemSet TLr0Automaton::GoTo(const TLr0ItemSet& items, const TSymbol& symbol) const {
        TLr0ItemSet result;
        for (const auto& item : items) {
            if (SymbolAfterDot(item) == symbol) {
                result.insert(TLr0Item{item.RuleId, item.Dot + 1});
            }
        }
        return Closure(result);
    }

    std::vector<TLr0Item> TLr0Automaton::SortedItems(TState state) const {
        const auto& items = States.at(state);
        std::vector<TLr0Item> result(items.begin(), items.end());
        std::sort(result.begin(), result.end());
        return result;
    }

    std::vector<TLr0Item> TLr0Automaton::Kernel(TState state) const {
        std::vector<TLr0Item> result;
        for (const auto& item : SortedItems(state)) {
            if (item.Dot > 0 || item.RuleId == GetAugmentedRuleId()) {
                result.push_back(item);
            }
        }
        return result;
    }

    std::string TLr0Automaton::ToString(const TLr0Item& item) const {
        const auto& rule = Rules.at(item.RuleId);
        std::stringstream ss;
        ss << rule.Left.ToString() << " " << TGrammar::SEPARATOR << " ";
        for (size_t i = 0; i < rule.Length(); ++i) {
            if (i == item.Dot) {
                ss << ".";
            }
            ss << rule.Right[i].ToString();
        }
        if (item.Dot == rule.Length()) {
            ss << ".";
        }
        return ss.str();
    }
}
