//
// Created by aowei on 2026 10月 19.
//

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include <nfasim/io/table_printer.hpp>

using namespace nfasim::io;
using nfasim::automaton::StateSet;

namespace {
    // 辅助函数：按行切分输出
    std::vector<std::string> lines_of(const std::string &text) {
        std::vector<std::string> lines;
        std::istringstream ss(text);
        for (std::string line; std::getline(ss, line);) {
            lines.push_back(line);
        }
        return lines;
    }
}

// 测试状态集合格式化
TEST(TablePrinterTest, FormatStates) {
    EXPECT_EQ(format_states({}), "");
    EXPECT_EQ(format_states({4}), "q4");
    EXPECT_EQ(format_states({3, 0, 1}), "{q0, q1, q3}");
}

// 测试路径格式化
TEST(TablePrinterTest, FormatPath) {
    EXPECT_EQ(format_path({0}), "q0");
    EXPECT_EQ(format_path({0, 1, 5, 9}), "q0→q1→q5→q9");
}

// 测试 UTF-8 显示宽度
TEST(TablePrinterTest, DisplayWidth) {
    EXPECT_EQ(display_width("q0"), 2);
    EXPECT_EQ(display_width(DELTA_CHARACTER), 1);
    EXPECT_EQ(display_width(NOOP_CHARACTER), 1);
    EXPECT_EQ(display_width("{q0, q1}"), 8);
}

// 测试转移表 -> 矩阵
TEST(TablePrinterTest, MatrixOfFiveStateTable) {
    const Matrix matrix = to_matrix(nfasim::automaton::five_state_table());

    ASSERT_EQ(matrix.size(), 6);
    EXPECT_EQ(matrix[0], (std::vector<std::string>{"δ", "0", "1", "2", "3"}));
    EXPECT_EQ(matrix[1], (std::vector<std::string>{"q0", "q0", "q0", "{q0, q1}", "q0"}));
    EXPECT_EQ(matrix[2], (std::vector<std::string>{"q1", "✕", "✕", "q2", "q3"}));
    EXPECT_EQ(matrix[5], (std::vector<std::string>{"q4", "q4", "q4", "q4", "q4"}));
}

// 测试带边框打印
TEST(TablePrinterTest, PrintsBorderedGrid) {
    std::ostringstream out;
    print_table({{"δ", "0"}, {"q0", "{q0, q1}"}}, out);

    const auto lines = lines_of(out.str());
    ASSERT_EQ(lines.size(), 5);
    EXPECT_EQ(lines[0], "+--------+--------+");
    EXPECT_EQ(lines[1], "|       δ|       0|");
    EXPECT_EQ(lines[2], "+--------+--------+");
    EXPECT_EQ(lines[3], "|      q0|{q0, q1}|");
    EXPECT_EQ(lines[4], "+--------+--------+");
}

// 测试整张 10 状态表的打印行数
TEST(TablePrinterTest, PrintsTenStateTable) {
    std::ostringstream out;
    print_table(to_matrix(nfasim::automaton::ten_state_table()), out);

    const auto lines = lines_of(out.str());
    // 1 行表头 + 10 行状态，每行后面跟一条边框
    ASSERT_EQ(lines.size(), 1 + 2 * 11);
    EXPECT_EQ(lines[0], "+--------+--------+--------+--------+--------+");
    EXPECT_EQ(lines[3], "|      q0|{q0, q1}|{q0, q2}|{q0, q3}|{q0, q4}|");
}

// 测试空矩阵不输出
TEST(TablePrinterTest, EmptyMatrixPrintsNothing) {
    std::ostringstream out;
    print_table({}, out);
    EXPECT_TRUE(out.str().empty());
}
