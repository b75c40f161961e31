#include "sudoku_csp/rules/fish.hpp"
#include <algorithm>

namespace sudoku_csp {

namespace {

// 行のグループは 0-8、列のグループは 9-17
constexpr size_t ROW_BASE = 0;
constexpr size_t COLUMN_BASE = GRID_SIZE;

/**
 * @brief ライン内で数字を許すセルの位置（0..8）をビットで返す
 */
unsigned positions_of(const Grid& grid, const Group& line, int digit, bool unsolved_only) {
    unsigned positions = 0;
    for (size_t i = 0; i < GRID_SIZE; ++i) {
        const Candidates& c = grid.cell(line.cells[i]);
        if (!c.contains(digit)) continue;
        if (unsolved_only && c.size() <= 1) continue;
        positions |= 1u << i;
    }
    return positions;
}

bool holds_solved(const Grid& grid, const Group& line, int digit) {
    for (size_t idx : line.cells) {
        if (grid.cell(idx) == Candidates::single(digit)) return true;
    }
    return false;
}

}  // namespace

// ============================================================================
// XWingRule implementation
// ============================================================================

std::string XWingRule::name() const {
    return "x_wing";
}

size_t XWingRule::apply(Grid& grid) {
    size_t count = 0;
    const Layout& layout = grid.layout();

    for (size_t i1 = 0; i1 + 1 < GRID_SIZE; ++i1) {
        for (size_t i2 = i1 + 1; i2 < GRID_SIZE; ++i2) {
            count += apply_pair(grid, layout.row(i1), layout.row(i2), COLUMN_BASE);
        }
    }
    for (size_t i1 = 0; i1 + 1 < GRID_SIZE; ++i1) {
        for (size_t i2 = i1 + 1; i2 < GRID_SIZE; ++i2) {
            count += apply_pair(grid, layout.column(i1), layout.column(i2), ROW_BASE);
        }
    }

    return count;
}

size_t XWingRule::apply_pair(Grid& grid, const Group& line1, const Group& line2, size_t perps) {
    size_t count = 0;
    const auto& groups = grid.layout().groups();

    for (int d = Candidates::MIN_DIGIT; d <= Candidates::MAX_DIGIT; ++d) {
        unsigned p1 = positions_of(grid, line1, d, false);
        if (__builtin_popcount(p1) != 2) continue;
        if (positions_of(grid, line2, d, false) != p1) continue;

        std::array<size_t, 2> cols{};
        size_t n = 0;
        for (size_t i = 0; i < GRID_SIZE; ++i) {
            if (p1 & (1u << i)) cols[n++] = i;
        }

        const std::array<size_t, 4> keep = {
            line1.cells[cols[0]], line1.cells[cols[1]],
            line2.cells[cols[0]], line2.cells[cols[1]]
        };

        for (size_t col : cols) {
            for (size_t idx : groups[perps + col].cells) {
                if (std::find(keep.begin(), keep.end(), idx) != keep.end()) continue;
                if (grid.cell(idx).remove(d)) {
                    ++count;
                }
            }
        }
    }

    return count;
}

// ============================================================================
// SwordfishRule implementation
// ============================================================================

std::string SwordfishRule::name() const {
    return "swordfish";
}

size_t SwordfishRule::apply(Grid& grid) {
    size_t count = 0;
    const Layout& layout = grid.layout();

    for (size_t i1 = 0; i1 + 2 < GRID_SIZE; ++i1) {
        for (size_t i2 = i1 + 1; i2 + 1 < GRID_SIZE; ++i2) {
            for (size_t i3 = i2 + 1; i3 < GRID_SIZE; ++i3) {
                count += apply_trio(grid, {&layout.row(i1), &layout.row(i2), &layout.row(i3)},
                                    COLUMN_BASE);
            }
        }
    }
    for (size_t i1 = 0; i1 + 2 < GRID_SIZE; ++i1) {
        for (size_t i2 = i1 + 1; i2 + 1 < GRID_SIZE; ++i2) {
            for (size_t i3 = i2 + 1; i3 < GRID_SIZE; ++i3) {
                count += apply_trio(grid, {&layout.column(i1), &layout.column(i2), &layout.column(i3)},
                                    ROW_BASE);
            }
        }
    }

    return count;
}

size_t SwordfishRule::apply_trio(Grid& grid, const std::array<const Group*, 3>& lines, size_t perps) {
    size_t count = 0;
    const auto& groups = grid.layout().groups();

    for (int d = Candidates::MIN_DIGIT; d <= Candidates::MAX_DIGIT; ++d) {
        bool skip = false;
        unsigned found_in_perps = 0;
        for (const Group* line : lines) {
            unsigned p = positions_of(grid, *line, d, true);
            if (__builtin_popcount(p) < 2 || holds_solved(grid, *line, d)) {
                skip = true;
                break;
            }
            found_in_perps |= p;
        }
        if (skip || __builtin_popcount(found_in_perps) != 3) continue;

        // 3 ライン x 3 直交ラインの交点 9 セルは残す
        std::array<size_t, 9> keep{};
        size_t n_keep = 0;
        for (const Group* line : lines) {
            for (size_t i = 0; i < GRID_SIZE; ++i) {
                if (found_in_perps & (1u << i)) keep[n_keep++] = line->cells[i];
            }
        }

        for (size_t i = 0; i < GRID_SIZE; ++i) {
            if (!(found_in_perps & (1u << i))) continue;
            for (size_t idx : groups[perps + i].cells) {
                if (std::find(keep.begin(), keep.end(), idx) != keep.end()) continue;
                if (grid.cell(idx).remove(d)) {
                    ++count;
                }
            }
        }
    }

    return count;
}

} // namespace sudoku_csp
