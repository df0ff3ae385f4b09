//
// Created by aowei on 2026 10月 19.
//

#ifndef NFASIM_APP_RUNNER_HPP
#define NFASIM_APP_RUNNER_HPP

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <nfasim/automaton/automaton.hpp>
#include <nfasim/automaton/transition_table.hpp>

namespace nfasim::app {
    // 为一个 token 新建自动机并逐字符读取；遇到非法字符时输出错误并放弃剩余字符，自动机仍会结束
    automaton::Verdict run_token(const automaton::TransitionTable &table, std::string_view token,
                                 std::ostream &out = std::cout);
    // 读取文件、切分 token 并逐个运行，返回运行的 token 数；文件不可用或没有 token 时返回 0
    std::size_t run_file(const automaton::TransitionTable &table, const std::string &filepath,
                         std::ostream &out = std::cout);
}

#endif //NFASIM_APP_RUNNER_HPP
