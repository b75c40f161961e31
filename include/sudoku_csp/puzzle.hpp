/**
 * @file puzzle.hpp
 * @brief 9x9 数字盤面と入力検証
 */
#ifndef SUDOKU_CSP_PUZZLE_HPP
#define SUDOKU_CSP_PUZZLE_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace sudoku_csp {

/// 盤面の一辺
constexpr size_t GRID_SIZE = 9;

/// ボックスの一辺
constexpr size_t BOX_SIZE = 3;

/// セル数
constexpr size_t CELL_COUNT = GRID_SIZE * GRID_SIZE;

/**
 * @brief 検証済みの 9x9 盤面（0 = 空白, 1-9 = 数字）
 */
using Puzzle = std::array<std::array<int, GRID_SIZE>, GRID_SIZE>;

/**
 * @brief 未検証の行リスト（パーサーや呼び出し側からの生入力）
 */
using PuzzleRows = std::vector<std::vector<int>>;

/**
 * @brief 盤面の形状または値が不正
 */
class MalformedInput : public std::runtime_error {
public:
    explicit MalformedInput(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief 生入力を検証して Puzzle に変換
 *
 * ちょうど 9 行 x 9 列で、全ての値が [0, 9] であること。
 *
 * @throws MalformedInput 最初に見つかった違反を含むメッセージ
 */
Puzzle validate_puzzle(const PuzzleRows& rows);

/**
 * @brief Puzzle を行リストに変換
 */
PuzzleRows to_rows(const Puzzle& puzzle);

/**
 * @brief 与えられた数字（0 以外）の個数
 */
size_t count_givens(const Puzzle& puzzle);

/**
 * @brief 完成した正しい解か
 *
 * 全ての行・列・ボックスに 1-9 がちょうど 1 回ずつ現れ、
 * givens の 0 以外のセルが変わっていないこと。
 */
bool is_valid_solution(const Puzzle& solution, const Puzzle& givens);

} // namespace sudoku_csp

#endif // SUDOKU_CSP_PUZZLE_HPP
