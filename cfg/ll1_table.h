#pragma once

#include "first_follow.h"
#include "grammar.h"
#include "recognizer.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace NCfg {
    /// Two productions predicted for the same (nonterminal, lookahead) cell.
    struct TLL1Conflict {
        TSymbol NonTerminal;
        TSymbol Lookahead;
        TProduction Existing;
        TProduction Incoming;

        std::string ToString() const;
    };

    class TLL1Table : public IRecognizer {
    public:
        /// Fails with the first collision met, visiting productions in grammar order
        /// and lookaheads in symbol order.
        static std::variant<TLL1Table, TLL1Conflict> Build(const TGrammar& grammar, const TFirstMap& first, const TFollowMap& follow);

        bool Parse(const std::string& input) const override;

        /// Rule id predicted for the nonterminal on the lookahead, std::nullopt is error.
        std::optional<size_t> GetRuleId(const TSymbol& nonTerminal, const TSymbol& lookahead) const;

        const TGrammar& GetGrammar() const {
            return Grammar;
        }

        size_t Size() const;

        friend bool operator==(const TLL1Table& lhs, const TLL1Table& rhs) {
            return lhs.Table == rhs.Table;
        }

        friend bool operator!=(const TLL1Table& lhs, const TLL1Table& rhs) {
            return !(lhs == rhs);
        }

    private:
        explicit TLL1Table(const TGrammar& grammar)
            : Grammar(grammar)
        {
        }

        /// Returns the conflict if the cell already predicts a different production.
        std::optional<TLL1Conflict> AddEntry(const TSymbol& nonTerminal, const TSymbol& lookahead, size_t ruleId);

    private:
        TGrammar Grammar;
        std::unordered_map<TSymbol, std::unordered_map<TSymbol, size_t>> Table;
    };
}
