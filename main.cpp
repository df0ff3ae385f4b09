//
// Created by aowei on 2026 10月 19.
//

#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <nfasim/app/runner.hpp>
#include <nfasim/automaton/transition_table.hpp>
#include <nfasim/io/table_printer.hpp>

namespace {
    // 命令行参数
    struct Options {
        std::string preset = "ten";
        std::optional<std::string> filepath;
    };

    void print_usage(const char *program) {
        std::cerr << "Usage: " << program << " [--preset five|ten] [file]" << std::endl;
    }

    // 解析失败返回 std::nullopt
    std::optional<Options> parse_options(const int argc, char **argv) {
        Options options;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--preset") {
                if (i + 1 >= argc) return std::nullopt;
                options.preset = argv[++i];
            } else if (!arg.empty() && arg[0] == '-') {
                return std::nullopt;
            } else if (!options.filepath) {
                options.filepath = arg;
            } else {
                return std::nullopt;
            }
        }
        return options;
    }
}

int main(int argc, char **argv) {
    const auto options = parse_options(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 1;
    }
    try {
        const auto &table = nfasim::automaton::preset_table(options->preset);
        std::cout << "Transition table:" << std::endl;
        nfasim::io::print_table(nfasim::io::to_matrix(table));

        std::string filepath;
        if (options->filepath) {
            filepath = *options->filepath;
        } else {
            std::cout << "Please enter file path: ";
            if (!(std::cin >> filepath)) {
                std::cerr << "No file path given" << std::endl;
                return 1;
            }
        }
        nfasim::app::run_file(table, filepath);
    } catch (const std::invalid_argument &e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "An error occurred: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
