//
// Created by aowei on 2026 10月 19.
//

#include <algorithm>
#include <sstream>
#include <nfasim/io/table_printer.hpp>

// 匿名数据
namespace nfasim::io {
    namespace {
        constexpr char HORIZONTAL_BORDER_KNOT = '+';
        constexpr char HORIZONTAL_BORDER_PATTERN = '-';
        constexpr char VERTICAL_BORDER_PATTERN = '|';

        // 边框：+---+---+...
        std::string create_horizontal_border(const std::size_t number_of_columns, const std::size_t width) {
            std::string border(1, HORIZONTAL_BORDER_KNOT);
            for (std::size_t i = 0; i < number_of_columns; ++i) {
                border.append(width, HORIZONTAL_BORDER_PATTERN);
                border.push_back(HORIZONTAL_BORDER_KNOT);
            }
            return border;
        }

        // 单元格左侧补空格到指定宽度，后接竖线
        std::string pad_cell(const std::string &text, const std::size_t width) {
            const std::size_t text_width = display_width(text);
            std::string cell(text_width < width ? width - text_width : 0, ' ');
            cell += text;
            cell.push_back(VERTICAL_BORDER_PATTERN);
            return cell;
        }

        std::string row_to_string(const std::vector<std::string> &row, const std::size_t width) {
            std::string line(1, VERTICAL_BORDER_PATTERN);
            for (const auto &cell: row) {
                line += pad_cell(cell, width);
            }
            return line;
        }
    }
}

// 状态格式化
namespace nfasim::io {
    std::string format_states(const automaton::StateSet &states) {
        std::ostringstream ss;
        // 空集合或只有一个状态时不加花括号
        const bool braces = states.size() > 1;
        if (braces) ss << "{";
        bool first = true;
        for (const auto state: states) {
            if (!first) ss << ", ";
            ss << "q" << state;
            first = false;
        }
        if (braces) ss << "}";
        return ss.str();
    }

    std::string format_path(const std::vector<automaton::StateId> &path) {
        std::ostringstream ss;
        for (std::size_t i = 0; i < path.size(); ++i) {
            if (i != 0) ss << PATH_ARROW;
            ss << "q" << path[i];
        }
        return ss.str();
    }
}

// 转移表打印
namespace nfasim::io {
    Matrix to_matrix(const automaton::TransitionTable &table) {
        Matrix matrix;
        // 表头：δ | 0 | 1 | 2 | 3
        std::vector<std::string> header{std::string(DELTA_CHARACTER)};
        for (const auto symbol: automaton::all_symbols()) {
            header.push_back(automaton::symbol_to_string(symbol));
        }
        matrix.push_back(std::move(header));
        // 每个状态一行：状态名 + 每个符号的后继集合
        for (const auto state: table.states()) {
            std::vector<std::string> row{"q" + std::to_string(state)};
            for (const auto symbol: automaton::all_symbols()) {
                std::string cell = format_states(table.successors(state, symbol));
                row.push_back(cell.empty() ? std::string(NOOP_CHARACTER) : std::move(cell));
            }
            matrix.push_back(std::move(row));
        }
        return matrix;
    }

    void print_table(const Matrix &matrix, std::ostream &out) {
        if (matrix.empty()) return;
        std::size_t number_of_columns = 0;
        std::size_t max_column_width = 0;
        for (const auto &row: matrix) {
            number_of_columns = std::max(number_of_columns, row.size());
            for (const auto &cell: row) {
                max_column_width = std::max(max_column_width, display_width(cell));
            }
        }
        const std::string horizontal_border = create_horizontal_border(number_of_columns, max_column_width);
        out << horizontal_border << std::endl;
        for (const auto &row: matrix) {
            out << row_to_string(row, max_column_width) << std::endl;
            out << horizontal_border << std::endl;
        }
    }

    std::size_t display_width(const std::string_view text) {
        // 跳过 UTF-8 续字节（10xxxxxx）
        return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](const char c) {
            return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
    }
}
