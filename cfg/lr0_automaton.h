#pragma once

#include "grammar.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace NCfg {
    using TState = size_t;

    /// A rule of the augmented grammar with a dot in [0, Length()].
    struct TLr0Item {
        size_t RuleId;
        size_t Dot;

        friend bool operator==(const TLr0Item& lhs, const TLr0Item& rhs) {
            return std::tie(lhs.RuleId, lhs.Dot) == std::tie(rhs.RuleId, rhs.Dot);
        }

        friend bool operator!=(const TLr0Item& lhs, const TLr0Item& rhs) {
            return !(lhs == rhs);
        }

        friend bool operator<(const TLr0Item& lhs, const TLr0Item& rhs) {
            return std::tie(lhs.RuleId, lhs.Dot) < std::tie(rhs.RuleId, rhs.Dot);
        }
    };

    class TLr0ItemHash {
    public:
        size_t operator()(const TLr0Item& item) const {
            size_t seed = 0;
            HashCombine(seed, item.RuleId);
            HashCombine(seed, item.Dot);
            return seed;
        }
    };

    using TLr0ItemSet = std::unordered_set<TLr0Item, TLr0ItemHash>;

    /// Canonical collection of LR(0) item sets of the grammar augmented with S' -> S.
    class TLr0Automaton {
    public:
        explicit TLr0Automaton(const TGrammar& grammar);

        const TGrammar& GetGrammar() const {
            return Grammar;
        }

        /// Grammar productions followed by the augmented start production.
        const std::vector<TProduction>& GetRules() const {
            return Rules;
        }

        size_t GetAugmentedRuleId() const {
            return Rules.size() - 1;
        }

        /// Nonterminal that no grammar line can produce.
        static TSymbol AugmentedStart() {
            return TSymbol::NonTerminal('\'');
        }

        const std::vector<TLr0ItemSet>& GetStates() const {
            return States;
        }

        size_t StateCount() const {
            return States.size();
        }

        /// std::nullopt if no item of the state advances over the symbol.
        std::optional<TState> GetTransition(TState state, const TSymbol& symbol) const;

        /// Outgoing transitions of the state in symbol order.
        std::vector<std::pair<TSymbol, TState>> GetTransitions(TState state) const;

        std::optional<TSymbol> SymbolAfterDot(const TLr0Item& item) const;

        bool IsComplete(const TLr0Item& item) const {
            return Rules.at(item.RuleId).Length() == item.Dot;
        }

        TLr0ItemSet Closure(const TLr0ItemSet& items) const;

        /// Empty set when no item advances over the symbol.
        TLr0ItemSet GoTo(const TLr0ItemSet& items, const TSymbol& symbol) const;

        /// Items of the state ordered by rule id and dot.
        std::vector<TLr0Item> SortedItems(TState state) const;

        /// Items that are not added by closure: the augmented start item and items with the dot moved.
        std::vector<TLr0Item> Kernel(TState state) const;

        std::string ToString(const TLr0Item& item) const;

    private:
        TGrammar Grammar;
        std::vector<TProduction> Rules;
        std::vector<TLr0ItemSet> States;
        std::unordered_map<TState, std::unordered_map<TSymbol, TState>> Transitions;
    };
}
