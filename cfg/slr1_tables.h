#pragma once

#include "first_follow.h"
#include "grammar.h"
#include "lr0_automaton.h"
#include "recognizer.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace NCfg {
    enum class EActionType {
        Shift,
        Reduce,
        Accept,
    };

    class TAction {
    public:
        TAction() = default;

        static TAction Shift(TState state) {
            return TAction(EActionType::Shift, state);
        }

        static TAction Reduce(size_t ruleId) {
            return TAction(EActionType::Reduce, ruleId);
        }

        static TAction Accept() {
            return TAction(EActionType::Accept, 0);
        }

        EActionType GetType() const {
            return Type;
        }

        TState GetState() const;

        size_t GetRuleId() const;

        /// "s3", "r2" or "acc".
        std::string ToString() const;

        friend bool operator==(const TAction& lhs, const TAction& rhs) {
            return std::tie(lhs.Type, lhs.StateOrRuleId) == std::tie(rhs.Type, rhs.StateOrRuleId);
        }

        friend bool operator!=(const TAction& lhs, const TAction& rhs) {
            return !(lhs == rhs);
        }

    private:
        TAction(EActionType type, size_t extra)
            : Type(type)
            , StateOrRuleId(extra)
        {
        }

    private:
        EActionType Type = EActionType::Accept;
        size_t StateOrRuleId = 0;
    };

    enum class EConflictKind {
        ShiftShift,
        ShiftReduce,
        ReduceReduce
    };

    std::string ToString(EConflictKind kind);

    /// Second action written to an occupied ACTION cell.
    struct TSlr1Conflict {
        EConflictKind Kind;
        TState State;
        TSymbol Lookahead;
        TAction Existing;
        TAction Incoming;
        std::string ExistingText;
        std::string IncomingText;

        std::string ToString() const;
    };

    class TActionTable {
        friend class TSlr1Tables;

    public:
        /// std::nullopt is error
        std::optional<TAction> GetAction(TState state, const TSymbol& lookahead) const {
            auto itState = Table.find(state);
            if (itState == Table.end()) {
                return std::nullopt;
            }
            auto it = itState->second.find(lookahead);
            if (it == itState->second.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        size_t Size() const;

    private:
        std::unordered_map<TState, std::unordered_map<TSymbol, TAction>> Table;
    };

    class TGotoTable {
        friend class TSlr1Tables;

    public:
        // std::nullopt is error
        std::optional<TState> GetState(TState state, const TSymbol& nonTerminal) const {
            auto itState = Table.find(state);
            if (itState == Table.end()) {
                return std::nullopt;
            }
            auto it = itState->second.find(nonTerminal);
            if (it == itState->second.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        size_t Size() const;

    private:
        std::unordered_map<TState, std::unordered_map<TSymbol, TState>> Table;
    };

    class TSlr1Tables : public IRecognizer {
    public:
        /// Builds the LR(0) automaton, then fills every state in a fixed order:
        /// shift and goto entries, the accept entry, reduce entries by rule id.
        static std::variant<TSlr1Tables, TSlr1Conflict> Build(const TGrammar& grammar, const TFollowMap& follow);

        bool Parse(const std::string& input) const override;

        const TLr0Automaton& GetAutomaton() const {
            return Automaton;
        }

        const TActionTable& GetActionTable() const {
            return ActionTable;
        }

        const TGotoTable& GetGotoTable() const {
            return GotoTable;
        }

    private:
        explicit TSlr1Tables(TLr0Automaton automaton)
            : Automaton(std::move(automaton))
        {
        }

        std::optional<TSlr1Conflict> AddAction(TState state, const TSymbol& lookahead, const TAction& action);

        std::string Describe(const TAction& action) const;

    private:
        TLr0Automaton Automaton;
        TActionTable ActionTable;
        TGotoTable GotoTable;
    };
}
