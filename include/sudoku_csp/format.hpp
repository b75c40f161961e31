/**
 * @file format.hpp
 * @brief 盤面のテキスト表現（ログ・出力用、盤面は変更しない）
 */
#ifndef SUDOKU_CSP_FORMAT_HPP
#define SUDOKU_CSP_FORMAT_HPP

#include "sudoku_csp/grid.hpp"
#include <string>

namespace sudoku_csp {

/**
 * @brief 候補集合を含む盤面ダンプ
 *
 * with_counts が true なら、先に各セルの候補数の表を出力する。
 * 各行は改行で終わる。
 */
std::string format_grid(const Grid& grid, bool with_counts = true);

/**
 * @brief 簡易表示
 *
 * 確定セルは数字、未確定は '?'、候補が空のセルは 'X'。
 */
std::string format_simple_grid(const Grid& grid);

/**
 * @brief 数字盤面を 9 行の数字列で表示（0 はそのまま）
 */
std::string format_puzzle(const Puzzle& puzzle);

/**
 * @brief 81 文字の 1 行表現
 */
std::string to_line(const Puzzle& puzzle);

} // namespace sudoku_csp

#endif // SUDOKU_CSP_FORMAT_HPP
