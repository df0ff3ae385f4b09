//
// Created by aowei on 2026 10月 19.
//

#ifndef NFASIM_AUTOMATON_TRANSITION_TABLE_HPP
#define NFASIM_AUTOMATON_TRANSITION_TABLE_HPP

#include <map>
#include <set>
#include <string_view>
#include <utility>
#include <nfasim/automaton/symbol.hpp>

// 转移表相关类型
namespace nfasim::automaton {
    using StateId = int;
    using StateSet = std::set<StateId>;
    // 键：(当前状态, 输入符号)，值：后继状态集合（空集合表示无转移）
    using TransitionKey = std::pair<StateId, Symbol>;
    using TransitionMap = std::map<TransitionKey, StateSet>;

    // 初始状态固定为 q0
    constexpr StateId INITIAL_STATE = 0;

    // 不可变的 NFA 转移表 + 接受状态集合，构造后不再修改
    class TransitionTable {
    public:
        TransitionTable(TransitionMap transitions, StateSet accepting_states);

        // 查询 δ(state, symbol)，没有条目时返回空集合
        [[nodiscard]] const StateSet &successors(StateId state, Symbol symbol) const;
        [[nodiscard]] bool is_accepting(StateId state) const;
        [[nodiscard]] const StateSet &accepting_states() const { return this->accepting_states_; }
        // 全部状态（升序）
        [[nodiscard]] const StateSet &states() const { return this->states_; }
        [[nodiscard]] const TransitionMap &transitions() const { return this->transitions_; }

    private:
        TransitionMap transitions_;
        StateSet accepting_states_;
        StateSet states_;
    };
}

// 预置转移表
namespace nfasim::automaton {
    // 5 个状态，接受状态 {2, 3, 4}
    const TransitionTable &five_state_table();
    // 10 个状态，接受状态 {9}：某个符号连续出现三次后进入 q9
    const TransitionTable &ten_state_table();
    // 按名称查找预置表（"five" / "ten"），未知名称抛出 std::invalid_argument
    const TransitionTable &preset_table(std::string_view name);
}

#endif //NFASIM_AUTOMATON_TRANSITION_TABLE_HPP
