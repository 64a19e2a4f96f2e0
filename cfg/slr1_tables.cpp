#include "slr1_tables.h"

#include <sstream>
#include <stdexcept>

namespace NCfg {
    TState TAction::GetState() const {
        if (Type != EActionType::Shift) {
            throw std::runtime_error("Action is not Shift");
        }
        return StateOrRuleId;
    }

    size_t TAction::GetRuleId() const {
        if (Type != EActionType::Reduce) {
            throw std::runtime_error("Action is not Reduce");
        }
        return StateOrRuleId;
    }

    std::string TAction::ToString() const {
        switch (Type) {
            case EActionType::Shift:
                return "s" + std::to_string(StateOrRuleId);
            case EActionType::Reduce:
                return "r" + std::to_string(StateOrRuleId);
            case EActionType::Accept:
                return "acc";
        }
        return {};
    }

    std::string ToString(EConflictKind kind) {
        switch (kind) {
            case EConflictKind::ShiftShift:
                return "Shift/Shift";
            case EConflictKind::ShiftReduce:
                return "Shift/Reduce";
            case EConflictKind::ReduceReduce:
                return "Reduce/Reduce";
        }
        return {};
    }

    std::string TSlr1Conflict::ToString() const {
        std::stringstream ss;
        ss << NCfg::ToString(Kind) << " conflict at state " << State << ", symbol " << Lookahead.ToString()
           << ": " << ExistingText << " / " << IncomingText;
        return ss.str();
    }

    size_t TActionTable::Size() const {
        size_t result = 0;
        for (const auto& [state, row] : Table) {
            result += row.size();
        }
        return result;
    }

    size_t TGotoTable::Size() const {
        size_t result = 0;
        for (const auto& [state, row] : Table) {
            result += row.size();
        }
        return result;
    }

    std::variant<TSlr1Tables, TSlr1Conflict> TSlr1Tables::Build(const TGrammar& grammar, const TFollowMap& follow) {
        TSlr1Tables tables{TLr0Automaton(grammar)};
        const auto& automaton = tables.Automaton;

        for (TState state = 0; state < automaton.StateCount(); ++state) {
            const auto items = automaton.SortedItems(state);

            for (const auto& item : items) {
                auto symbol = automaton.SymbolAfterDot(item);
                if (!symbol || !symbol->IsTerminal()) {
                    continue;
                }
                auto target = automaton.GetTransition(state, *symbol);
                if (!target) {
                    throw std::runtime_error("Not found goto set in canonical system");
                }
                if (auto conflict = tables.AddAction(state, *symbol, TAction::Shift(*target))) {
                    return *conflict;
                }
            }

            for (const auto& [symbol, target] : automaton.GetTransitions(state)) {
                if (symbol.IsNonTerminal()) {
                    tables.GotoTable.Table[state][symbol] = target;
                }
            }

            for (const auto& item : items) {
                if (item.RuleId == automaton.GetAugmentedRuleId() && automaton.IsComplete(item)) {
                    if (auto conflict = tables.AddAction(state, TSymbol::EndMarker(), TAction::Accept())) {
                        return *conflict;
                    }
                }
            }

            for (const auto& item : items) {
                if (item.RuleId == automaton.GetAugmentedRuleId() || !automaton.IsComplete(item)) {
                    continue;
                }
                const auto& left = automaton.GetRules()[item.RuleId].Left;
                auto it = follow.find(left);
                if (it == follow.end()) {
                    continue;
                }
                for (const auto& lookahead : Sorted(it->second)) {
                    if (auto conflict = tables.AddAction(state, lookahead, TAction::Reduce(item.RuleId))) {
                        return *conflict;
                    }
                }
            }
        }

        return tables;
    }

    std::optional<TSlr1Conflict> TSlr1Tables::AddAction(TState state, const TSymbol& lookahead, const TAction& action) {
        auto [it, inserted] = ActionTable.Table[state].try_emplace(lookahead, action);
        if (inserted) {
            return std::nullopt;
        }

        const auto existing = it->second;
        if (existing == action) {
            return std::nullopt;
        }
        const auto& rules = Automaton.GetRules();
        if (existing.GetType() == EActionType::Reduce && action.GetType() == EActionType::Reduce
            && rules[existing.GetRuleId()] == rules[action.GetRuleId()])
        {
            return std::nullopt;
        }

        EConflictKind kind = EConflictKind::ReduceReduce;
        if (existing.GetType() == EActionType::Shift && action.GetType() == EActionType::Shift) {
            kind = EConflictKind::ShiftShift;
        } else if (existing.GetType() == EActionType::Shift || action.GetType() == EActionType::Shift) {
            kind = EConflictKind::ShiftReduce;
        }

        return TSlr1Conflict{kind, state, lookahead, existing, action, Describe(existing), Describe(action)};
    }

    std::string TSlr1Tables::Describe(const TAction& action) const {
        switch (action.GetType()) {
            case EActionType::Shift:
                return "shift " + std::to_string(action.GetState());
            case EActionType::Reduce:
                return "reduce " + Automaton.GetRules()[action.GetRuleId()].ToString();
            case EActionType::Accept:
                return "accept";
        }
        return {};
    }

    bool TSlr1Tables::Parse(const std::string& input) const {
        const auto symbols = ToInputSymbols(input);
        std::vector<TState> stateStack = {0};
        std::vector<TSymbol> symbolStack;
        size_t cursor = 0;

        while (cursor < symbols.size()) {
            auto action = ActionTable.GetAction(stateStack.back(), symbols[cursor]);
            if (!action) {
                return false;
            }

            switch (action->GetType()) {
                case EActionType::Shift:
                    symbolStack.push_back(symbols[cursor]);
                    stateStack.push_back(action->GetState());
                    ++cursor;
                    break;
                case EActionType::Reduce: {
                    const auto& rule = Automaton.GetRules()[action->GetRuleId()];
                    if (rule.Length() >= stateStack.size()) {
                        return false;
                    }
                    for (size_t i = 0; i < rule.Length(); ++i) {
                        stateStack.pop_back();
                        symbolStack.pop_back();
                    }
                    auto nextState = GotoTable.GetState(stateStack.back(), rule.Left);
                    if (!nextState) {
                        return false;
                    }
                    symbolStack.push_back(rule.Left);
                    stateStack.push_back(*nextState);
                    break;
                }
                case EActionType::Accept:
                    return true;
            }
        }

        return false;
    }
}
