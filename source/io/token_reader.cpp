//
// Created by aowei on 2026 10月 19.
//

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nfasim/io/token_reader.hpp>

namespace nfasim::io {
    namespace {
        constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

        std::string_view trim(std::string_view text) {
            const auto begin = text.find_first_not_of(WHITESPACE);
            if (begin == std::string_view::npos) return {};
            const auto end = text.find_last_not_of(WHITESPACE);
            return text.substr(begin, end - begin + 1);
        }
    }

    std::string read_file_to_string(const std::string &filename) {
        // 以二进制模式打开，避免文本模式下的换行符转换
        std::ifstream file(filename, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file: " + filename);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        // 空文件会让 buffer 置 failbit，这里只检查文件本身的读错误
        if (file.bad()) {
            throw std::runtime_error("Failed to read file: " + filename);
        }
        return buffer.str();
    }

    std::vector<std::string> split_tokens(const std::string_view content, const std::string_view separator) {
        std::vector<std::string> tokens;
        if (separator.empty()) {
            throw std::invalid_argument("Token separator must not be empty");
        }
        std::size_t start = 0;
        while (start <= content.size()) {
            auto end = content.find(separator, start);
            if (end == std::string_view::npos) end = content.size();
            const auto token = trim(content.substr(start, end - start));
            if (!token.empty()) tokens.emplace_back(token);
            start = end + separator.size();
        }
        return tokens;
    }
}
