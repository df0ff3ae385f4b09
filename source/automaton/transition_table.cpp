//
// Created by aowei on 2026 10月 19.
//

#include <stdexcept>
#include <string>
#include <nfasim/automaton/transition_table.hpp>

// TransitionTable 的实现
namespace nfasim::automaton {
    TransitionTable::TransitionTable(TransitionMap transitions, StateSet accepting_states)
        : transitions_(std::move(transitions)), accepting_states_(std::move(accepting_states)) {
        // 表中出现过的行即为全部状态
        for (const auto &[key, targets]: this->transitions_) {
            if (key.first < 0) {
                throw std::invalid_argument("Negative state id in transition table: " + std::to_string(key.first));
            }
            this->states_.insert(key.first);
        }
        if (this->states_.count(INITIAL_STATE) == 0) {
            throw std::invalid_argument("Transition table has no row for the initial state q0");
        }
        // 后继状态与接受状态都必须是表中的状态
        for (const auto &[key, targets]: this->transitions_) {
            for (const StateId target: targets) {
                if (this->states_.count(target) == 0) {
                    throw std::invalid_argument("Transition to unknown state q" + std::to_string(target));
                }
            }
        }
        for (const StateId state: this->accepting_states_) {
            if (this->states_.count(state) == 0) {
                throw std::invalid_argument("Unknown accepting state q" + std::to_string(state));
            }
        }
    }

    const StateSet &TransitionTable::successors(const StateId state, const Symbol symbol) const {
        static const StateSet no_transition{};
        const auto it = this->transitions_.find({state, symbol});
        if (it == this->transitions_.end()) return no_transition;
        return it->second;
    }

    bool TransitionTable::is_accepting(const StateId state) const {
        return this->accepting_states_.count(state) != 0;
    }
}

// 预置转移表
namespace nfasim::automaton {
    const TransitionTable &five_state_table() {
        static const TransitionTable table{
            {
                {{0, Symbol::ZERO}, {0}}, {{0, Symbol::ONE}, {0}}, {{0, Symbol::TWO}, {0, 1}}, {{0, Symbol::THREE}, {0}},
                {{1, Symbol::ZERO}, {}}, {{1, Symbol::ONE}, {}}, {{1, Symbol::TWO}, {2}}, {{1, Symbol::THREE}, {3}},
                {{2, Symbol::ZERO}, {4}}, {{2, Symbol::ONE}, {4}}, {{2, Symbol::TWO}, {2}}, {{2, Symbol::THREE}, {3}},
                {{3, Symbol::ZERO}, {}}, {{3, Symbol::ONE}, {}}, {{3, Symbol::TWO}, {}}, {{3, Symbol::THREE}, {3}},
                {{4, Symbol::ZERO}, {4}}, {{4, Symbol::ONE}, {4}}, {{4, Symbol::TWO}, {4}}, {{4, Symbol::THREE}, {4}},
            },
            {2, 3, 4}
        };
        return table;
    }

    const TransitionTable &ten_state_table() {
        static const TransitionTable table{
            {
                {{0, Symbol::ZERO}, {0, 1}}, {{0, Symbol::ONE}, {0, 2}}, {{0, Symbol::TWO}, {0, 3}}, {{0, Symbol::THREE}, {0, 4}},
                {{1, Symbol::ZERO}, {5}}, {{1, Symbol::ONE}, {}}, {{1, Symbol::TWO}, {}}, {{1, Symbol::THREE}, {}},
                {{2, Symbol::ZERO}, {}}, {{2, Symbol::ONE}, {6}}, {{2, Symbol::TWO}, {}}, {{2, Symbol::THREE}, {}},
                {{3, Symbol::ZERO}, {}}, {{3, Symbol::ONE}, {}}, {{3, Symbol::TWO}, {7}}, {{3, Symbol::THREE}, {}},
                {{4, Symbol::ZERO}, {}}, {{4, Symbol::ONE}, {}}, {{4, Symbol::TWO}, {}}, {{4, Symbol::THREE}, {8}},
                {{5, Symbol::ZERO}, {9}}, {{5, Symbol::ONE}, {}}, {{5, Symbol::TWO}, {}}, {{5, Symbol::THREE}, {}},
                {{6, Symbol::ZERO}, {}}, {{6, Symbol::ONE}, {9}}, {{6, Symbol::TWO}, {}}, {{6, Symbol::THREE}, {}},
                {{7, Symbol::ZERO}, {}}, {{7, Symbol::ONE}, {}}, {{7, Symbol::TWO}, {9}}, {{7, Symbol::THREE}, {}},
                {{8, Symbol::ZERO}, {}}, {{8, Symbol::ONE}, {}}, {{8, Symbol::TWO}, {}}, {{8, Symbol::THREE}, {9}},
                {{9, Symbol::ZERO}, {9}}, {{9, Symbol::ONE}, {9}}, {{9, Symbol::TWO}, {9}}, {{9, Symbol::THREE}, {9}},
            },
            {9}
        };
        return table;
    }

    const TransitionTable &preset_table(const std::string_view name) {
        if (name == "five") return five_state_table();
        if (name == "ten") return ten_state_table();
        throw std::invalid_argument("Unknown transition table preset: " + std::string(name));
    }
}
