//
// Created by aowei on 2026 10月 19.
//

#include <stdexcept>
#include <vector>
#include <nfasim/app/runner.hpp>
#include <nfasim/automaton/symbol.hpp>
#include <nfasim/io/token_reader.hpp>

namespace nfasim::app {
    automaton::Verdict run_token(const automaton::TransitionTable &table, const std::string_view token,
                                 std::ostream &out) {
        out << std::endl << "Reading token: " << token << std::endl;
        automaton::Automaton nfa(table, out);
        try {
            // 字符必须严格从左到右读取
            for (const char c: token) {
                nfa.consume(automaton::symbol_of(c));
            }
        } catch (const automaton::SymbolNotAcceptedError &e) {
            out << e.what() << std::endl;
        } catch (const std::exception &e) {
            out << "An error occurred: " << e.what() << std::endl;
        }
        return nfa.close();
    }

    std::size_t run_file(const automaton::TransitionTable &table, const std::string &filepath, std::ostream &out) {
        std::vector<std::string> tokens;
        try {
            tokens = io::split_tokens(io::read_file_to_string(filepath));
        } catch (const std::runtime_error &e) {
            out << "File not found, is not readable or has no content (" << e.what() << ")" << std::endl;
            return 0;
        }
        if (tokens.empty()) {
            out << "File not found, is not readable or has no content" << std::endl;
            return 0;
        }
        for (const auto &token: tokens) {
            run_token(table, token, out);
        }
        return tokens.size();
    }
}
