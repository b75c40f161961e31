#include "sudoku_csp/format.hpp"
#include <sstream>

namespace sudoku_csp {

std::string format_grid(const Grid& grid, bool with_counts) {
    std::ostringstream os;

    if (with_counts) {
        for (size_t r = 0; r < GRID_SIZE; ++r) {
            for (size_t c = 0; c < GRID_SIZE; ++c) {
                if (c > 0) os << ' ';
                os << grid.at(r, c).size();
            }
            os << '\n';
        }
        os << '\n';
    }

    for (size_t r = 0; r < GRID_SIZE; ++r) {
        if (r > 0 && r % BOX_SIZE == 0) {
            os << std::string(GRID_SIZE * 10 + 3, '-') << '\n';
        }
        for (size_t c = 0; c < GRID_SIZE; ++c) {
            if (c > 0 && c % BOX_SIZE == 0) os << "| ";
            std::string digits;
            for (auto d : grid.at(r, c).values()) {
                digits += static_cast<char>('0' + d);
            }
            if (digits.empty()) digits = "X";
            digits.resize(GRID_SIZE, ' ');
            os << digits << ' ';
        }
        os << '\n';
    }
    return os.str();
}

std::string format_simple_grid(const Grid& grid) {
    std::ostringstream os;
    for (size_t r = 0; r < GRID_SIZE; ++r) {
        for (size_t c = 0; c < GRID_SIZE; ++c) {
            if (c > 0) os << ' ';
            const Candidates& cell = grid.at(r, c);
            if (cell.empty()) {
                os << 'X';
            } else if (cell.is_singleton()) {
                os << cell.min();
            } else {
                os << '?';
            }
        }
        os << '\n';
    }
    return os.str();
}

std::string format_puzzle(const Puzzle& puzzle) {
    std::string out;
    for (const auto& row : puzzle) {
        for (int v : row) {
            out += static_cast<char>('0' + v);
        }
        out += '\n';
    }
    return out;
}

std::string to_line(const Puzzle& puzzle) {
    std::string out;
    out.reserve(CELL_COUNT);
    for (const auto& row : puzzle) {
        for (int v : row) {
            out += static_cast<char>('0' + v);
        }
    }
    return out;
}

} // namespace sudoku_csp
