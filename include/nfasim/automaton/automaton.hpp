//
// Created by aowei on 2026 10月 19.
//

#ifndef NFASIM_AUTOMATON_AUTOMATON_HPP
#define NFASIM_AUTOMATON_AUTOMATON_HPP

#include <iostream>
#include <map>
#include <optional>
#include <vector>
#include <nfasim/automaton/symbol.hpp>
#include <nfasim/automaton/transition_table.hpp>

// 1. 路径与结论定义
namespace nfasim::automaton {
    // 一条具体的非确定运行：从 q0 开始，每次成功转移追加一个状态
    using Path = std::vector<StateId>;

    // 结束时的结论
    struct Verdict {
        StateId final_state; // 所有路径末状态中的最大值
        bool accepting;      // final_state 是否为接受状态
        Path path;           // 展示用的状态变化路径
    };
}

// 2. NFA 模拟器
namespace nfasim::automaton {
    /*
     * 并行跟踪所有存活路径的 NFA。
     * 两个逻辑状态：活动（路径非空）和挂起（某个符号让所有路径同时死亡后进入，之后 consume 不再生效）。
     * 所有报告都写入构造时传入的输出流。
     * 对象析构时如果还没有调用 close()，会自动调用一次，保证每条退出路径都恰好结束一次。
     */
    class Automaton {
    public:
        explicit Automaton(const TransitionTable &table, std::ostream &out = std::cout);
        ~Automaton();
        // 持有输出流引用且析构有副作用，禁止拷贝和移动
        Automaton(const Automaton &) = delete;
        Automaton &operator=(const Automaton &) = delete;
        Automaton(Automaton &&) = delete;
        Automaton &operator=(Automaton &&) = delete;

        // 读取一个符号并转移；仅当本次转移让自动机从非接受变为接受时返回 true
        bool consume(Symbol symbol);
        // 输出最终状态与状态变化路径，只在第一次调用时输出
        const Verdict &close();

        [[nodiscard]] const std::vector<Path> &paths() const { return this->paths_; }
        // 所有路径的末状态（升序去重）
        [[nodiscard]] StateSet current_states() const;
        [[nodiscard]] bool on_hold() const { return this->on_hold_; }
        [[nodiscard]] bool accepting() const;
        [[nodiscard]] bool closed() const { return this->verdict_.has_value(); }
        // 当前连续出现次数（只记录最近成功读取的符号）
        [[nodiscard]] int streak(Symbol symbol) const;
        // 连续出现达到三次及以上的累计次数
        [[nodiscard]] int triplets(Symbol symbol) const;

    private:
        void increment_occurrence(Symbol symbol);
        void print_current_states() const;
        void print_occurrences() const;
        [[nodiscard]] const Path &select_final_path() const;

        const TransitionTable &table;
        std::ostream &out;
        std::vector<Path> paths_;
        bool on_hold_ = false;
        std::map<Symbol, int> temp_occurrences;
        std::map<Symbol, int> triplet_occurrences;
        std::optional<Verdict> verdict_;
    };
}

#endif //NFASIM_AUTOMATON_AUTOMATON_HPP
