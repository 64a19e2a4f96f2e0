#pragma once

#include <functional>
#include <string>
#include <tuple>
#include <unordered_set>
#include <vector>

namespace NCfg {
    /// Declaration order is the presentation order of symbol kinds.
    enum class ESymbolType {
        Epsilon,
        Terminal,
        NonTerminal,
        EndMarker
    };

    class TSymbol {
    public:
        static constexpr char EPSILON_CHAR = 'e';
        static constexpr char END_MARKER_CHAR = '$';

    public:
        TSymbol() = default;

        static TSymbol Terminal(char value);
        static TSymbol NonTerminal(char value);
        static TSymbol Epsilon();
        static TSymbol EndMarker();

        /// Uppercase letters are nonterminals, 'e' is epsilon, '$' is the end marker,
        /// everything else is a terminal.
        static TSymbol Classify(char c);

        ESymbolType GetType() const {
            return Type;
        }

        char GetValue() const {
            return Value;
        }

        bool IsTerminal() const {
            return Type == ESymbolType::Terminal;
        }

        bool IsNonTerminal() const {
            return Type == ESymbolType::NonTerminal;
        }

        bool IsEpsilon() const {
            return Type == ESymbolType::Epsilon;
        }

        bool IsEndMarker() const {
            return Type == ESymbolType::EndMarker;
        }

        std::string ToString() const;

        friend bool operator==(const TSymbol& lhs, const TSymbol& rhs) {
            return std::tie(lhs.Type, lhs.Value) == std::tie(rhs.Type, rhs.Value);
        }

        friend bool operator!=(const TSymbol& lhs, const TSymbol& rhs) {
            return !(lhs == rhs);
        }

        friend bool operator<(const TSymbol& lhs, const TSymbol& rhs) {
            return std::tie(lhs.Type, lhs.Value) < std::tie(rhs.Type, rhs.Value);
        }

    private:
        TSymbol(ESymbolType type, char value)
            : Type(type)
            , Value(value)
        {
        }

    private:
        ESymbolType Type = ESymbolType::Epsilon;
        char Value = EPSILON_CHAR;
    };

    template <typename T>
    inline void HashCombine(size_t& seed, const T& v) {
        seed ^= std::hash<T>()(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
}

namespace std {
    template <>
    struct hash<NCfg::TSymbol> {
        size_t operator()(const NCfg::TSymbol& symbol) const {
            size_t seed = 0;
            NCfg::HashCombine(seed, static_cast<int>(symbol.GetType()));
            NCfg::HashCombine(seed, symbol.GetValue());
            return seed;
        }
    };
}

namespace NCfg {
    using TSymbolSet = std::unordered_set<TSymbol>;

    /// Symbols of the set in the presentation order.
    std::vector<TSymbol> Sorted(const TSymbolSet& symbols);

    /// "{a, b, $}" in the presentation order.
    std::string ToString(const TSymbolSet& symbols);
}
