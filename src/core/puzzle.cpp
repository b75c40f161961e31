#include "sudoku_csp/puzzle.hpp"

namespace sudoku_csp {

Puzzle validate_puzzle(const PuzzleRows& rows) {
    if (rows.size() != GRID_SIZE) {
        throw MalformedInput("puzzle is not a 9x9 grid: " + std::to_string(rows.size()) + " rows");
    }

    Puzzle puzzle{};
    for (size_t r = 0; r < GRID_SIZE; ++r) {
        if (rows[r].size() != GRID_SIZE) {
            throw MalformedInput("puzzle is not a 9x9 grid: row " + std::to_string(r) +
                                 " has " + std::to_string(rows[r].size()) + " values");
        }
        for (size_t c = 0; c < GRID_SIZE; ++c) {
            int v = rows[r][c];
            if (v < 0 || v > 9) {
                throw MalformedInput("invalid value " + std::to_string(v) + " at row " +
                                     std::to_string(r) + ", column " + std::to_string(c));
            }
            puzzle[r][c] = v;
        }
    }
    return puzzle;
}

PuzzleRows to_rows(const Puzzle& puzzle) {
    PuzzleRows rows;
    rows.reserve(GRID_SIZE);
    for (const auto& row : puzzle) {
        rows.emplace_back(row.begin(), row.end());
    }
    return rows;
}

size_t count_givens(const Puzzle& puzzle) {
    size_t count = 0;
    for (const auto& row : puzzle) {
        for (int v : row) {
            if (v != 0) ++count;
        }
    }
    return count;
}

bool is_valid_solution(const Puzzle& solution, const Puzzle& givens) {
    for (size_t r = 0; r < GRID_SIZE; ++r) {
        for (size_t c = 0; c < GRID_SIZE; ++c) {
            int v = solution[r][c];
            if (v < 1 || v > 9) return false;
            if (givens[r][c] != 0 && givens[r][c] != v) return false;
        }
    }

    // 行・列・ボックスごとに出現ビットを立てる
    for (size_t i = 0; i < GRID_SIZE; ++i) {
        unsigned row_seen = 0;
        unsigned col_seen = 0;
        unsigned box_seen = 0;
        size_t br = (i / BOX_SIZE) * BOX_SIZE;
        size_t bc = (i % BOX_SIZE) * BOX_SIZE;
        for (size_t j = 0; j < GRID_SIZE; ++j) {
            row_seen |= 1u << solution[i][j];
            col_seen |= 1u << solution[j][i];
            box_seen |= 1u << solution[br + j / BOX_SIZE][bc + j % BOX_SIZE];
        }
        if (row_seen != 0x3FE || col_seen != 0x3FE || box_seen != 0x3FE) {
            return false;
        }
    }
    return true;
}

} // namespace sudoku_csp
