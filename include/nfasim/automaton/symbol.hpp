//
// Created by aowei on 2026 10月 19.
//

#ifndef NFASIM_AUTOMATON_SYMBOL_HPP
#define NFASIM_AUTOMATON_SYMBOL_HPP

#include <array>
#include <stdexcept>
#include <string>

// 1. 输入字母表定义
namespace nfasim::automaton {
    // 自动机只接受四个输入符号，使用 enum class 保证类型安全
    enum class Symbol {
        ZERO,  // '0'
        ONE,   // '1'
        TWO,   // '2'
        THREE, // '3'
    };

    // 读取到字母表之外的字符时抛出
    class SymbolNotAcceptedError : public std::runtime_error {
    public:
        explicit SymbolNotAcceptedError(char value);

        [[nodiscard]] char value() const noexcept { return this->value_; }

    private:
        char value_;
    };
}

// 2. 字符与符号的相互转换
namespace nfasim::automaton {
    // 字符 -> 符号，非法字符抛出 SymbolNotAcceptedError
    Symbol symbol_of(char value);
    // 符号 -> 字符
    char symbol_to_char(Symbol symbol);
    std::string symbol_to_string(Symbol symbol);
    // 按转移表列顺序排列的全部符号
    const std::array<Symbol, 4> &all_symbols();
}

#endif //NFASIM_AUTOMATON_SYMBOL_HPP
