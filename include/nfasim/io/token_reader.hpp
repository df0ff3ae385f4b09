//
// Created by aowei on 2026 10月 19.
//

#ifndef NFASIM_IO_TOKEN_READER_HPP
#define NFASIM_IO_TOKEN_READER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace nfasim::io {
    // 输入文件中 token 之间的分隔符
    constexpr std::string_view TOKEN_SEPARATOR = "#";

    // 整个文件读入字符串，打不开或读取失败时抛出 std::runtime_error
    std::string read_file_to_string(const std::string &filename);
    // 按分隔符切分，去掉首尾空白并丢弃空 token
    std::vector<std::string> split_tokens(std::string_view content, std::string_view separator = TOKEN_SEPARATOR);
}

#endif //NFASIM_IO_TOKEN_READER_HPP
