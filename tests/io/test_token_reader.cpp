//
// Created by aowei on 2026 10月 19.
//

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nfasim/io/token_reader.hpp>

using namespace nfasim::io;

// 测试按分隔符切分并去除空白
TEST(TokenReaderTest, SplitsAndTrims) {
    EXPECT_EQ(split_tokens("0123#  2223 #\n12x3\n"), (std::vector<std::string>{"0123", "2223", "12x3"}));
}

// 测试丢弃空 token
TEST(TokenReaderTest, DropsBlankTokens) {
    EXPECT_EQ(split_tokens("##  # \t\n#0#"), (std::vector<std::string>{"0"}));
    EXPECT_TRUE(split_tokens("").empty());
    EXPECT_TRUE(split_tokens(" \n ").empty());
}

// 测试 token 内部空白保留
TEST(TokenReaderTest, KeepsInnerWhitespace) {
    EXPECT_EQ(split_tokens("01 23"), (std::vector<std::string>{"01 23"}));
}

// 测试自定义分隔符
TEST(TokenReaderTest, CustomSeparator) {
    EXPECT_EQ(split_tokens("1;;2;3", ";;"), (std::vector<std::string>{"1", "2;3"}));
    EXPECT_THROW(split_tokens("1#2", ""), std::invalid_argument);
}

// 测试读取文件
TEST(TokenReaderTest, ReadsWholeFile) {
    const std::string path = testing::TempDir() + "nfasim_token_reader.txt";
    {
        std::ofstream file(path, std::ios::binary);
        file << "0#1\r\n#2";
    }
    EXPECT_EQ(read_file_to_string(path), "0#1\r\n#2");
    std::remove(path.c_str());
}

// 测试文件不存在
TEST(TokenReaderTest, MissingFileThrows) {
    EXPECT_THROW(read_file_to_string(testing::TempDir() + "nfasim_no_such_file.txt"), std::runtime_error);
}
