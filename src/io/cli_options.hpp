/**
 * @file cli_options.hpp
 * @brief コマンドライン引数の解析
 */
#ifndef SUDOKU_CSP_IO_CLI_OPTIONS_HPP
#define SUDOKU_CSP_IO_CLI_OPTIONS_HPP

#include "sudoku_csp/solver.hpp"
#include <stdexcept>
#include <string>

namespace sudoku_csp {
namespace io {

/**
 * @brief 引数の誤り（未知のオプション、値の欠落など）
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

struct CliOptions {
    bool print_all = false;
    bool print_stats = false;
    bool show_help = false;
    int verbose_level = 0;
    SearchOrder order = SearchOrder::DepthFirst;
    size_t solution_limit = Solver::DEFAULT_SOLUTION_LIMIT;
    std::string filename;
};

/**
 * @brief 引数を解析
 *
 * -h/--help があればその時点で show_help を立てて返す。
 *
 * @throws UsageError 未知のオプション、値の欠落・不正、ファイル名なし
 */
CliOptions parse_options(int argc, const char* const argv[]);

} // namespace io
} // namespace sudoku_csp

#endif // SUDOKU_CSP_IO_CLI_OPTIONS_HPP
