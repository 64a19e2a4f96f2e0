#include "symbol.h"

#include <algorithm>
#include <sstream>

namespace NCfg {
    TSymbol TSymbol::Terminal(char value) {
        return TSymbol(ESymbolType::Terminal, value);
    }

    TSymbol TSymbol::NonTerminal(char value) {
        return TSymbol(ESymbolType::NonTerminal, value);
    }

    TSymbol TSymbol::Epsilon() {
        return TSymbol(ESymbolType::Epsilon, EPSILON_CHAR);
    }

    TSymbol TSymbol::EndMarker() {
        return TSymbol(ESymbolType::EndMarker, END_MARKER_CHAR);
    }

    TSymbol TSymbol::Classify(char c) {
        if (c >= 'A' && c <= 'Z') {
            return NonTerminal(c);
        }
        if (c == EPSILON_CHAR) {
            return Epsilon();
        }
        if (c == END_MARKER_CHAR) {
            return EndMarker();
        }
        return Terminal(c);
    }

    std::string TSymbol::ToString() const {
        switch (Type) {
            case ESymbolType::Epsilon:
                return std::string(1, EPSILON_CHAR);
            case ESymbolType::EndMarker:
                return std::string(1, END_MARKER_CHAR);
            case ESymbolType::Terminal:
            case ESymbolType::NonTerminal:
                return std::string(1, Value);
        }
        return {};
    }

    std::vector<TSymbol> Sorted(const TSymbolSet& symbols) {
        std::vector<TSymbol> result(symbols.begin(), symbols.end());
        std::sort(result.begin(), result.end());
        return result;
    }

    std::string ToString(const TSymbolSet& symbols) {
        std::stringstream ss;
        ss << "{";
        bool first = true;
        for (const auto& symbol : Sorted(symbols)) {
            if (!first) {
                ss << ", ";
            }
            ss << symbol.ToString();
            first = false;
        }
        ss << "}";
        return ss.str();
    }
}
