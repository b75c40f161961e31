#include "sudoku_csp/rules/basic.hpp"

namespace sudoku_csp {

// ============================================================================
// EliminateFoundRule implementation
// ============================================================================

std::string EliminateFoundRule::name() const {
    return "eliminate_found";
}

size_t EliminateFoundRule::apply(Grid& grid) {
    size_t count = 0;

    for (const auto& group : grid.layout().groups()) {
        for (size_t idx : group.cells) {
            const Candidates found = grid.cell(idx);
            if (!found.is_singleton()) continue;

            for (size_t other : group.cells) {
                if (other == idx) continue;
                count += grid.cell(other).remove_all(found);
            }
        }
    }

    return count;
}

// ============================================================================
// UniqueCellRule implementation
// ============================================================================

std::string UniqueCellRule::name() const {
    return "unique_cell";
}

size_t UniqueCellRule::apply(Grid& grid) {
    size_t count = 0;

    for (const auto& group : grid.layout().groups()) {
        for (int d = Candidates::MIN_DIGIT; d <= Candidates::MAX_DIGIT; ++d) {
            size_t found_in = CELL_COUNT;
            size_t occurrences = 0;
            for (size_t idx : group.cells) {
                if (grid.cell(idx).contains(d)) {
                    found_in = idx;
                    if (++occurrences > 1) break;
                }
            }

            if (occurrences == 1 && grid.cell(found_in).size() > 1) {
                count += grid.cell(found_in).assign(d);
            }
        }
    }

    return count;
}

} // namespace sudoku_csp
