#pragma once

#include "symbol.h"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace NCfg {
    class TFormatError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct TProduction {
        TSymbol Left;
        std::vector<TSymbol> Right;

        /// Right is exactly [Epsilon].
        bool IsEpsilon() const {
            return Right.size() == 1 && Right[0].IsEpsilon();
        }

        /// Number of symbols a reduction by this production pops, 0 for the epsilon production.
        size_t Length() const {
            return IsEpsilon() ? 0 : Right.size();
        }

        std::string ToString() const;

        friend bool operator==(const TProduction& lhs, const TProduction& rhs) {
            return std::tie(lhs.Left, lhs.Right) == std::tie(rhs.Left, rhs.Right);
        }

        friend bool operator!=(const TProduction& lhs, const TProduction& rhs) {
            return !(lhs == rhs);
        }
    };

    class TGrammar {
    public:
        static constexpr char START_CHAR = 'S';
        static constexpr const char* SEPARATOR = "->";

    public:
        /// Throws TFormatError when there is no production for the start symbol,
        /// a left-hand side is not a nonterminal or a right-hand side is empty
        /// or contains the end marker.
        explicit TGrammar(std::vector<TProduction> productions);

        /// Every line is "A -> alt1 alt2 ...", each alternative becoming one production.
        static TGrammar FromLines(const std::vector<std::string>& lines);

        /// The first line holds the number of production lines that follow.
        static TGrammar FromCountedLines(const std::vector<std::string>& lines);

        /// Decimal count line of the counted input format.
        static size_t ParseProductionCount(const std::string& line);

        /// Productions of one "A -> alt1 alt2 ..." line.
        static std::vector<TProduction> ParseProductionLine(const std::string& line);

        const std::vector<TProduction>& GetProductions() const {
            return Productions;
        }

        const TProduction& GetProduction(size_t ruleId) const {
            return Productions.at(ruleId);
        }

        const TSymbol& GetStart() const {
            return Start;
        }

        /// Distinct left-hand sides in first-seen order.
        const std::vector<TSymbol>& GetNonTerminals() const {
            return NonTerminals;
        }

        /// Distinct terminals of the right-hand sides in first-seen order.
        const std::vector<TSymbol>& GetTerminals() const {
            return Terminals;
        }

        bool IsKnownTerminal(const TSymbol& symbol) const;

        /// Rule ids of the nonterminal in insertion order, empty for an unknown symbol.
        const std::vector<size_t>& FindRules(const TSymbol& nonTerminal) const;

        std::vector<TProduction> ProductionsOf(const TSymbol& nonTerminal) const;

        std::string ToString() const;

    private:
        TSymbol Start = TSymbol::NonTerminal(START_CHAR);
        std::vector<TProduction> Productions;
        std::vector<TSymbol> NonTerminals;
        std::vector<TSymbol> Terminals;
        std::unordered_map<TSymbol, std::vector<size_t>> RulesByNonTerminal;
    };
}

namespace std {
    template <>
    struct hash<NCfg::TProduction> {
        size_t operator()(const NCfg::TProduction& production) const {
            size_t seed = 0;
            NCfg::HashCombine(seed, production.Left);
            for (const auto& symbol : production.Right) {
                NCfg::HashCombine(seed, symbol);
            }
            return seed;
        }
    };
}
