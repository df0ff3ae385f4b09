//
// Created by aowei on 2026 10月 19.
//

#ifndef NFASIM_IO_TABLE_PRINTER_HPP
#define NFASIM_IO_TABLE_PRINTER_HPP

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <nfasim/automaton/transition_table.hpp>

// 全局常量部分
namespace nfasim::io {
    // 表头左上角：转移函数 δ
    constexpr std::string_view DELTA_CHARACTER = "δ";
    // 无转移时的占位符
    constexpr std::string_view NOOP_CHARACTER = "✕";
    // 路径中状态之间的箭头
    constexpr std::string_view PATH_ARROW = "→";

    using Matrix = std::vector<std::vector<std::string> >;
}

// 状态格式化
namespace nfasim::io {
    // 空集合 -> ""，单个状态 -> "q1"，多个状态 -> "{q0, q1}"
    std::string format_states(const automaton::StateSet &states);
    // q0→q1→q2
    std::string format_path(const std::vector<automaton::StateId> &path);
}

// 转移表打印
namespace nfasim::io {
    // 转移表 -> 二维字符串矩阵，第一行为表头
    Matrix to_matrix(const automaton::TransitionTable &table);
    // 带边框打印矩阵，每个单元格左侧补齐到最宽单元格的宽度；空矩阵不输出
    void print_table(const Matrix &matrix, std::ostream &out = std::cout);
    // UTF-8 字符串的显示宽度（按码点计数）
    std::size_t display_width(std::string_view text);
}

#endif //NFASIM_IO_TABLE_PRINTER_HPP
