#include "grammar.h"

#include <boost/fusion/include/adapt_struct.hpp>
#include <boost/spirit/include/qi.hpp>

#include <algorithm>
#include <sstream>

namespace {
    struct TProductionLine {
        std::string Left;
        std::vector<std::string> Alternatives;
    };
}

BOOST_FUSION_ADAPT_STRUCT(
    TProductionLine,
    Left,
    Alternatives
)

namespace {
    using namespace NCfg;
    namespace qi = boost::spirit::qi;

    template <typename TIterator>
    class TProductionLineParser : public qi::grammar<TIterator, TProductionLine(), qi::space_type> {
    public:
        TProductionLineParser()
            : TProductionLineParser::base_type(Line)
        {
            Left = qi::lexeme[+(qi::graph - qi::lit(TGrammar::SEPARATOR))];
            Alternative = qi::lexeme[+qi::graph];
            Line = Left >> qi::lit(TGrammar::SEPARATOR) >> *Alternative;
        }

    private:
        qi::rule<TIterator, TProductionLine(), qi::space_type> Line;
        qi::rule<TIterator, std::string(), qi::space_type> Left;
        qi::rule<TIterator, std::string(), qi::space_type> Alternative;
    };

    /// Epsilon is the empty string, so it only survives as the whole right-hand side.
    std::vector<TSymbol> ToRightSide(const std::string& alternative) {
        std::vector<TSymbol> result;
        for (char c : alternative) {
            auto symbol = TSymbol::Classify(c);
            if (!symbol.IsEpsilon()) {
                result.push_back(symbol);
            }
        }
        if (result.empty()) {
            result.push_back(TSymbol::Epsilon());
        }
        return result;
    }
}

namespace NCfg {
    std::string TProduction::ToString() const {
        std::stringstream ss;
        ss << Left.ToString() << " " << TGrammar::SEPARATOR << " ";
        for (const auto& symbol : Right) {
            ss << symbol.ToString();
        }
        return ss.str();
    }

    size_t TGrammar::ParseProductionCount(const std::string& line) {
        unsigned count = 0;
        auto first = line.cbegin();
        auto last = line.cend();
        if (!qi::phrase_parse(first, last, qi::uint_, qi::space, count) || first != last) {
            throw TFormatError("Invalid production count: " + line);
        }
        return count;
    }

    TGrammar::TGrammar(std::vector<TProduction> productions)
        : Productions(std::move(productions))
    {
        for (size_t ruleId = 0; ruleId < Productions.size(); ++ruleId) {
            const auto& production = Productions[ruleId];
            if (!production.Left.IsNonTerminal()) {
                throw TFormatError("Left-hand side must be a nonterminal: " + production.ToString());
            }
            if (production.Right.empty()) {
                throw TFormatError("Right-hand side must not be empty, use 'e' for epsilon: " + production.Left.ToString());
            }

            auto [it, inserted] = RulesByNonTerminal.try_emplace(production.Left);
            if (inserted) {
                NonTerminals.push_back(production.Left);
            }
            it->second.push_back(ruleId);

            for (const auto& symbol : production.Right) {
                if (symbol.IsEndMarker()) {
                    throw TFormatError("End marker is not allowed in a right-hand side: " + production.ToString());
                }
                if (symbol.IsEpsilon() && !production.IsEpsilon()) {
                    throw TFormatError("Epsilon must be the whole right-hand side: " + production.ToString());
                }
                if (symbol.IsTerminal() && !IsKnownTerminal(symbol)) {
                    Terminals.push_back(symbol);
                }
            }
        }

        if (!RulesByNonTerminal.count(Start)) {
            throw TFormatError("Grammar has no production for the start symbol " + Start.ToString());
        }
    }

    TGrammar TGrammar::FromLines(const std::vector<std::string>& lines) {
        std::vector<TProduction> productions;
        for (const auto& line : lines) {
            auto lineProductions = ParseProductionLine(line);
            productions.insert(productions.end(), lineProductions.begin(), lineProductions.end());
        }
        return TGrammar(std::move(productions));
    }

    TGrammar TGrammar::FromCountedLines(const std::vector<std::string>& lines) {
        if (lines.empty()) {
            throw TFormatError("Empty grammar input");
        }
        const auto count = ParseProductionCount(lines[0]);
        if (lines.size() - 1 != count) {
            std::stringstream ss;
            ss << "Expected " << count << " production lines, got " << lines.size() - 1;
            throw TFormatError(ss.str());
        }
        return FromLines(std::vector<std::string>(lines.begin() + 1, lines.end()));
    }

    std::vector<TProduction> TGrammar::ParseProductionLine(const std::string& line) {
        static const TProductionLineParser<std::string::const_iterator> parser;

        TProductionLine parsed;
        auto first = line.cbegin();
        auto last = line.cend();
        if (!qi::phrase_parse(first, last, parser, qi::space, parsed) || first != last) {
            throw TFormatError("Invalid production format: " + line);
        }
        if (parsed.Left.size() != 1) {
            throw TFormatError("Left-hand side must be a single character: " + parsed.Left);
        }
        const auto left = TSymbol::Classify(parsed.Left[0]);
        if (!left.IsNonTerminal()) {
            throw TFormatError("Left-hand side must be an uppercase letter: " + parsed.Left);
        }
        if (parsed.Alternatives.empty()) {
            throw TFormatError("Production has no alternatives: " + line);
        }

        std::vector<TProduction> result;
        for (const auto& alternative : parsed.Alternatives) {
            if (alternative == SEPARATOR) {
                throw TFormatError("Separator must appear once: " + line);
            }
            result.push_back({left, ToRightSide(alternative)});
        }
        return result;
    }

    bool TGrammar::IsKnownTerminal(const TSymbol& symbol) const {
        return std::find(Terminals.begin(), Terminals.end(), symbol) != Terminals.end();
    }

    const std::vector<size_t>& TGrammar::FindRules(const TSymbol& nonTerminal) const {
        static const std::vector<size_t> empty = {};

        auto it = RulesByNonTerminal.find(nonTerminal);
        if (it == RulesByNonTerminal.end()) {
            return empty;
        }
        return it->second;
    }

    std::vector<TProduction> TGrammar::ProductionsOf(const TSymbol& nonTerminal) const {
        std::vector<TProduction> result;
        for (auto ruleId : FindRules(nonTerminal)) {
            result.push_back(Productions[ruleId]);
        }
        return result;
    }

    std::string TGrammar::ToString() const {
        std::stringstream ss;
        for (const auto& production : Productions) {
            ss << production.ToString() << "\n";
        }
        return ss.str();
    }
}
