#pragma once

#include "grammar.h"

#include <unordered_map>
#include <vector>

namespace NCfg {
    /// FIRST of every terminal, nonterminal, epsilon and the end marker.
    using TFirstMap = std::unordered_map<TSymbol, TSymbolSet>;

    /// FOLLOW of every nonterminal.
    using TFollowMap = std::unordered_map<TSymbol, TSymbolSet>;

    /// FIRST of a symbol sequence: {Epsilon} for the empty sequence, otherwise the
    /// non-epsilon FIRST symbols of the nullable prefix and of the first non-nullable
    /// symbol, plus Epsilon when the whole sequence is nullable.
    /// A symbol missing from the map has an empty FIRST set.
    TSymbolSet FirstOfString(const std::vector<TSymbol>& seq, const TFirstMap& first);

    TFirstMap ComputeFirst(const TGrammar& grammar);

    TFollowMap ComputeFollow(const TGrammar& grammar, const TFirstMap& first);
}
