#include "sudoku_csp/rules/tuple.hpp"

namespace sudoku_csp {

// ============================================================================
// NakedTupleRule implementation
// ============================================================================

std::string NakedTupleRule::name() const {
    return "naked_tuple";
}

size_t NakedTupleRule::apply(Grid& grid) {
    size_t count = 0;

    for (const auto& group : grid.layout().groups()) {
        for (size_t idx : group.cells) {
            const Candidates tuple = grid.cell(idx);
            if (tuple.size() <= 1) continue;

            // tuple に包含されるセル（自身を含む）
            std::array<bool, GRID_SIZE> subsumed{};
            size_t n_subsumed = 0;
            for (size_t i = 0; i < GRID_SIZE; ++i) {
                if (grid.cell(group.cells[i]).is_subset_of(tuple)) {
                    subsumed[i] = true;
                    ++n_subsumed;
                }
            }
            if (n_subsumed != tuple.size()) continue;

            for (size_t i = 0; i < GRID_SIZE; ++i) {
                if (!subsumed[i]) {
                    count += grid.cell(group.cells[i]).remove_all(tuple);
                }
            }
        }
    }

    return count;
}

// ============================================================================
// HiddenTupleRule implementation
// ============================================================================

std::string HiddenTupleRule::name() const {
    return "hidden_tuple";
}

size_t HiddenTupleRule::apply(Grid& grid) {
    size_t count = 0;

    for (const auto& group : grid.layout().groups()) {
        for (size_t idx : group.cells) {
            const Candidates tuple = grid.cell(idx);
            if (tuple.size() <= 1) continue;

            size_t n_supersets = 0;
            bool partial_overlap = false;
            for (size_t other : group.cells) {
                const Candidates& c = grid.cell(other);
                if (c.is_superset_of(tuple)) {
                    ++n_supersets;
                } else if (c.intersects(tuple)) {
                    partial_overlap = true;
                    break;
                }
            }
            if (partial_overlap || n_supersets != tuple.size()) continue;

            for (size_t other : group.cells) {
                Candidates& c = grid.cell(other);
                if (c.size() > tuple.size() && c.is_superset_of(tuple)) {
                    count += c.intersect(tuple);
                }
            }
        }
    }

    return count;
}

} // namespace sudoku_csp
