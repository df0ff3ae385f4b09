//
// Created by aowei on 2026 10月 19.
//

#include <algorithm>
#include <iterator>
#include <numeric>
#include <nfasim/automaton/automaton.hpp>
#include <nfasim/io/table_printer.hpp>

// 构造与析构
namespace nfasim::automaton {
    Automaton::Automaton(const TransitionTable &table, std::ostream &out)
        : table(table), out(out), paths_{Path{INITIAL_STATE}} {
        print_current_states();
    }

    Automaton::~Automaton() {
        if (!closed()) close();
    }
}

// 状态转移
namespace nfasim::automaton {
    bool Automaton::consume(const Symbol symbol) {
        this->out << "Reading symbol: " << symbol_to_char(symbol) << std::endl;
        // 挂起后不再转移
        if (this->on_hold_) return false;

        // 1. 每条路径按 δ(末状态, symbol) 分裂，每个后继状态生成一条新路径
        std::vector<Path> next_paths;
        for (const auto &path: this->paths_) {
            for (const StateId target: this->table.successors(path.back(), symbol)) {
                Path next = path;
                next.push_back(target);
                next_paths.push_back(std::move(next));
            }
        }

        // 2. 所有路径同时死亡：进入挂起，计数器保持不变
        if (next_paths.empty()) {
            this->on_hold_ = true;
            this->out << "No transition for symbol " << symbol_to_char(symbol)
                    << ", automaton is on hold" << std::endl;
            print_current_states();
            return false;
        }

        // 3. 成功转移：替换路径集合并更新计数器
        const bool was_accepting = accepting();
        this->paths_ = std::move(next_paths);
        increment_occurrence(symbol);
        print_current_states();

        // 4. 新进入接受状态时输出三连计数
        const bool newly_accepting = !was_accepting && accepting();
        if (newly_accepting) print_occurrences();
        return newly_accepting;
    }

    void Automaton::increment_occurrence(const Symbol symbol) {
        // 清除其他符号的临时计数，只保留当前符号
        for (auto it = this->temp_occurrences.begin(); it != this->temp_occurrences.end();) {
            if (it->first != symbol) {
                it = this->temp_occurrences.erase(it);
            } else {
                ++it;
            }
        }
        if (++this->temp_occurrences[symbol] >= 3) {
            ++this->triplet_occurrences[symbol];
        }
    }
}

// 查询
namespace nfasim::automaton {
    StateSet Automaton::current_states() const {
        StateSet states;
        for (const auto &path: this->paths_) {
            states.insert(path.back());
        }
        return states;
    }

    bool Automaton::accepting() const {
        return std::any_of(this->paths_.begin(), this->paths_.end(), [this](const Path &path) {
            return this->table.is_accepting(path.back());
        });
    }

    int Automaton::streak(const Symbol symbol) const {
        const auto it = this->temp_occurrences.find(symbol);
        return it == this->temp_occurrences.end() ? 0 : it->second;
    }

    int Automaton::triplets(const Symbol symbol) const {
        const auto it = this->triplet_occurrences.find(symbol);
        return it == this->triplet_occurrences.end() ? 0 : it->second;
    }
}

// 结束与输出
namespace nfasim::automaton {
    const Verdict &Automaton::close() {
        if (this->verdict_) return *this->verdict_;

        const Path &path = select_final_path();
        const StateId final_state = path.back();
        const bool is_accepting = this->table.is_accepting(final_state);
        this->verdict_ = Verdict{final_state, is_accepting, path};

        this->out << "Final automaton state: q" << final_state
                << " (" << (is_accepting ? "accepting" : "rejecting") << ")" << std::endl;
        this->out << "State change path: " << io::format_path(path) << std::endl;
        return *this->verdict_;
    }

    // 选取末状态最大的路径；末状态相同时取状态和最大的一条，再相同则取最先生成的
    const Path &Automaton::select_final_path() const {
        const auto sum = [](const Path &path) { return std::accumulate(path.begin(), path.end(), 0); };
        auto best = this->paths_.begin();
        for (auto it = std::next(best); it != this->paths_.end(); ++it) {
            if (it->back() > best->back() || (it->back() == best->back() && sum(*it) > sum(*best))) {
                best = it;
            }
        }
        return *best;
    }

    void Automaton::print_current_states() const {
        this->out << "Current automaton states: " << io::format_states(current_states()) << std::endl;
    }

    void Automaton::print_occurrences() const {
        for (const auto &[symbol, occurrences]: this->triplet_occurrences) {
            this->out << "Symbol " << symbol_to_char(symbol) << " was tripled " << occurrences
                    << " times already" << std::endl;
        }
    }
}
