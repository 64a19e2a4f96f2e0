#pragma once

#include <cfg/first_follow.h>
#include <cfg/grammar.h>
#include <cfg/ll1_table.h>
#include <cfg/slr1_tables.h>

#include <algorithm>
#include <deque>
#include <set>
#include <string>
#include <variant>
#include <vector>

inline NCfg::TSymbol Term(char c) {
    return NCfg::TSymbol::Terminal(c);
}

inline NCfg::TSymbol NonTerm(char c) {
    return NCfg::TSymbol::NonTerminal(c);
}

inline NCfg::TSymbolSet Set(const std::string& symbols) {
    NCfg::TSymbolSet result;
    for (char c : symbols) {
        result.insert(NCfg::TSymbol::Classify(c));
    }
    return result;
}

struct TAnalysis {
    explicit TAnalysis(const std::vector<std::string>& lines)
        : Grammar(NCfg::TGrammar::FromLines(lines))
        , First(NCfg::ComputeFirst(Grammar))
        , Follow(NCfg::ComputeFollow(Grammar, First))
    {
    }

    std::variant<NCfg::TLL1Table, NCfg::TLL1Conflict> BuildLL1() const {
        return NCfg::TLL1Table::Build(Grammar, First, Follow);
    }

    std::variant<NCfg::TSlr1Tables, NCfg::TSlr1Conflict> BuildSlr1() const {
        return NCfg::TSlr1Tables::Build(Grammar, Follow);
    }

    NCfg::TGrammar Grammar;
    NCfg::TFirstMap First;
    NCfg::TFollowMap Follow;
};

/// Terminal strings reachable from the start symbol by at most maxSteps leftmost derivation steps.
inline std::set<std::string> EnumerateSentences(const NCfg::TGrammar& grammar, size_t maxSteps, size_t maxLength = 12) {
    using NCfg::TSymbol;

    struct TForm {
        std::vector<TSymbol> Symbols;
        size_t Steps;
    };

    std::set<std::string> result;
    std::deque<TForm> queue;
    queue.push_back({{grammar.GetStart()}, 0});

    while (!queue.empty()) {
        auto form = std::move(queue.front());
        queue.pop_front();

        auto it = std::find_if(form.Symbols.begin(), form.Symbols.end(), [](const TSymbol& symbol) {
            return symbol.IsNonTerminal();
        });
        if (it == form.Symbols.end()) {
            std::string sentence;
            for (const auto& symbol : form.Symbols) {
                sentence.push_back(symbol.GetValue());
            }
            result.insert(sentence);
            continue;
        }
        if (form.Steps == maxSteps) {
            continue;
        }

        const size_t position = it - form.Symbols.begin();
        for (const auto& production : grammar.ProductionsOf(*it)) {
            std::vector<TSymbol> next(form.Symbols.begin(), form.Symbols.begin() + position);
            if (!production.IsEpsilon()) {
                next.insert(next.end(), production.Right.begin(), production.Right.end());
            }
            next.insert(next.end(), form.Symbols.begin() + position + 1, form.Symbols.end());
            if (next.size() <= maxLength) {
                queue.push_back({std::move(next), form.Steps + 1});
            }
        }
    }

    return result;
}
