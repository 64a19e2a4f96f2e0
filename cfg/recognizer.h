#pragma once

#include "symbol.h"

#include <string>
#include <vector>

namespace NCfg {
    /// Decides membership of a string in the language of a grammar.
    class IRecognizer {
    public:
        virtual ~IRecognizer() = default;

        /// Never throws: characters outside the terminal alphabet only lead to rejection.
        virtual bool Parse(const std::string& input) const = 0;
    };

    /// Every character as a terminal, followed by the end marker.
    inline std::vector<TSymbol> ToInputSymbols(const std::string& input) {
        std::vector<TSymbol> result;
        result.reserve(input.size() + 1);
        for (char c : input) {
            result.push_back(TSymbol::Terminal(c));
        }
        result.push_back(TSymbol::EndMarker());
        return result;
    }
}
