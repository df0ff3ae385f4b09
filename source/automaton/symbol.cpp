//
// Created by aowei on 2026 10月 19.
//

#include <nfasim/automaton/symbol.hpp>

namespace nfasim::automaton {
    SymbolNotAcceptedError::SymbolNotAcceptedError(const char value)
        : std::runtime_error(std::string("Automaton doesn't accept symbol: ") + value), value_(value) {}

    Symbol symbol_of(const char value) {
        switch (value) {
            case '0':
                return Symbol::ZERO;
            case '1':
                return Symbol::ONE;
            case '2':
                return Symbol::TWO;
            case '3':
                return Symbol::THREE;
            default:
                throw SymbolNotAcceptedError(value);
        }
    }

    char symbol_to_char(const Symbol symbol) {
        switch (symbol) {
            case Symbol::ZERO:
                return '0';
            case Symbol::ONE:
                return '1';
            case Symbol::TWO:
                return '2';
            case Symbol::THREE:
                return '3';
        }
        throw std::invalid_argument("Unknown symbol value");
    }

    std::string symbol_to_string(const Symbol symbol) {
        return std::string(1, symbol_to_char(symbol));
    }

    const std::array<Symbol, 4> &all_symbols() {
        static const std::array<Symbol, 4> symbols{Symbol::ZERO, Symbol::ONE, Symbol::TWO, Symbol::THREE};
        return symbols;
    }
}
