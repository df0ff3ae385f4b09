//
// Created by aowei on 2026 10月 19.
//

#include <gtest/gtest.h>
#include <string>
#include <nfasim/automaton/symbol.hpp>

using namespace nfasim::automaton;

// 测试合法字符转换
TEST(SymbolTest, AcceptedCharacters) {
    EXPECT_EQ(symbol_of('0'), Symbol::ZERO);
    EXPECT_EQ(symbol_of('1'), Symbol::ONE);
    EXPECT_EQ(symbol_of('2'), Symbol::TWO);
    EXPECT_EQ(symbol_of('3'), Symbol::THREE);
}

// 测试符号还原为字符
TEST(SymbolTest, SymbolToCharacter) {
    for (const auto symbol: all_symbols()) {
        EXPECT_EQ(symbol_of(symbol_to_char(symbol)), symbol);
    }
    EXPECT_EQ(symbol_to_string(Symbol::THREE), "3");
}

// 测试字母表之外的所有字符都抛出 SymbolNotAcceptedError
TEST(SymbolTest, RejectsEveryOtherCharacter) {
    for (int i = -128; i < 128; ++i) {
        const char c = static_cast<char>(i);
        if (c >= '0' && c <= '3') continue;
        EXPECT_THROW(symbol_of(c), SymbolNotAcceptedError) << "character code " << i;
    }
}

// 测试异常携带非法字符和错误信息
TEST(SymbolTest, ErrorCarriesCharacter) {
    try {
        symbol_of('x');
        FAIL() << "expected SymbolNotAcceptedError";
    } catch (const SymbolNotAcceptedError &e) {
        EXPECT_EQ(e.value(), 'x');
        EXPECT_EQ(std::string(e.what()), "Automaton doesn't accept symbol: x");
    }
}

// 测试列顺序
TEST(SymbolTest, ColumnOrder) {
    const auto &symbols = all_symbols();
    ASSERT_EQ(symbols.size(), 4);
    EXPECT_EQ(symbols[0], Symbol::ZERO);
    EXPECT_EQ(symbols[3], Symbol::THREE);
}
