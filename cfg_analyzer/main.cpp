#include <cfg/first_follow.h>
#include <cfg/grammar.h>
#include <cfg/ll1_table.h>
#include <cfg/slr1_tables.h>
#include <cfg/table_printer.h>

#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {
    using namespace NCfg;

    struct TOptions {
        bool Verbose = false;
    };

    void PrintUsage(std::ostream& out) {
        out << "Usage: cfg_analyzer [-v|--verbose] [-h|--help] < grammar\n"
            << "Reads a production count and that many production lines,\n"
            << "then decides the strings that follow with an LL(1) or SLR(1) parser.\n";
    }

    /// Count line and at most that many production lines.
    std::vector<std::string> ReadGrammarLines(std::istream& in) {
        std::vector<std::string> lines;
        std::string line;
        if (!std::getline(in, line)) {
            throw TFormatError("Empty grammar input");
        }
        lines.push_back(line);

        const auto count = TGrammar::ParseProductionCount(line);
        for (size_t i = 0; i < count && std::getline(in, line); ++i) {
            lines.push_back(line);
        }
        return lines;
    }

    /// Prints "yes" or "no" for every line until an empty line or the end of input.
    void ParseStringsUntilEmpty(std::istream& in, std::ostream& out, const IRecognizer& recognizer) {
        std::string line;
        while (std::getline(in, line)) {
            const auto first = line.find_first_not_of(" \t\r");
            if (first == std::string::npos) {
                break;
            }
            const auto last = line.find_last_not_of(" \t\r");
            out << (recognizer.Parse(line.substr(first, last - first + 1)) ? "yes" : "no") << std::endl;
        }
    }

    void PrintLL1(std::ostream& out, const TLL1Table& table) {
        out << "\n--- LL(1) Parsing Table ---\n";
        PrintLL1Table(out, table);
        out << "---------------------------\n";
    }

    void PrintSlr1(std::ostream& out, const TSlr1Tables& tables) {
        out << "\n--- SLR(1) Automaton States and Tables ---\n";
        PrintStates(out, tables.GetAutomaton());
        PrintActionTable(out, tables);
        PrintGotoTable(out, tables);
        out << "------------------------------------------\n";
    }

    void InteractiveMode(const TOptions& options, const TLL1Table& ll1, const TSlr1Tables& slr1) {
        std::string choice;
        while (true) {
            std::cout << "Select a parser (T: for LL(1), B: for SLR(1), Q: quit):" << std::endl;
            if (!std::getline(std::cin, choice)) {
                break;
            }
            const auto first = choice.find_first_not_of(" \t\r");
            const char answer = first == std::string::npos ? '\0' : choice[first];

            if (answer == 'Q' || answer == 'q') {
                break;
            } else if (answer == 'T' || answer == 't') {
                if (options.Verbose) {
                    PrintLL1(std::cout, ll1);
                }
                ParseStringsUntilEmpty(std::cin, std::cout, ll1);
            } else if (answer == 'B' || answer == 'b') {
                if (options.Verbose) {
                    PrintSlr1(std::cout, slr1);
                }
                ParseStringsUntilEmpty(std::cin, std::cout, slr1);
            }
        }
    }
}

int main(int argc, char* argv[]) {
    TOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            options.Verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage(std::cout);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            PrintUsage(std::cerr);
            return 2;
        }
    }

    std::optional<TGrammar> grammar;
    try {
        grammar.emplace(TGrammar::FromCountedLines(ReadGrammarLines(std::cin)));
    } catch (const TFormatError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    const auto first = ComputeFirst(*grammar);
    const auto follow = ComputeFollow(*grammar, first);
    if (options.Verbose) {
        std::cout << "Grammar:\n" << grammar->ToString() << "\n";
        PrintFirstSets(std::cout, *grammar, first);
        PrintFollowSets(std::cout, *grammar, follow);
    }

    auto ll1Result = TLL1Table::Build(*grammar, first, follow);
    auto slr1Result = TSlr1Tables::Build(*grammar, follow);
    const auto* ll1 = std::get_if<TLL1Table>(&ll1Result);
    const auto* slr1 = std::get_if<TSlr1Tables>(&slr1Result);

    if (options.Verbose) {
        if (const auto* conflict = std::get_if<TLL1Conflict>(&ll1Result)) {
            std::cout << "Not LL(1): " << conflict->ToString() << "\n";
        }
        if (const auto* conflict = std::get_if<TSlr1Conflict>(&slr1Result)) {
            std::cout << "Not SLR(1): " << conflict->ToString() << "\n";
        }
    }

    if (ll1 && slr1) {
        InteractiveMode(options, *ll1, *slr1);
    } else if (ll1) {
        std::cout << "Grammar is LL(1)." << std::endl;
        if (options.Verbose) {
            PrintLL1(std::cout, *ll1);
        }
        ParseStringsUntilEmpty(std::cin, std::cout, *ll1);
    } else if (slr1) {
        std::cout << "Grammar is SLR(1)." << std::endl;
        if (options.Verbose) {
            PrintSlr1(std::cout, *slr1);
        }
        ParseStringsUntilEmpty(std::cin, std::cout, *slr1);
    } else {
        std::cout << "Grammar is neither LL(1) nor SLR(1)." << std::endl;
    }

    return 0;
}
