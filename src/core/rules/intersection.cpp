#include "sudoku_csp/rules/intersection.hpp"

namespace sudoku_csp {

namespace {

template <size_t N>
Candidates union_of(const Grid& grid, const std::array<size_t, N>& cells) {
    Candidates result;
    for (size_t idx : cells) {
        result |= grid.cell(idx);
    }
    return result;
}

template <size_t N>
size_t remove_digit(Grid& grid, const std::array<size_t, N>& cells, int digit) {
    size_t count = 0;
    for (size_t idx : cells) {
        if (grid.cell(idx).remove(digit)) {
            ++count;
        }
    }
    return count;
}

}  // namespace

// ============================================================================
// LockedCandidatesRule implementation
// ============================================================================

std::string LockedCandidatesRule::name() const {
    return "locked_candidates";
}

size_t LockedCandidatesRule::apply(Grid& grid) {
    size_t count = 0;

    for (const auto& triplet : grid.layout().triplets()) {
        Candidates in_triplet;
        for (size_t idx : triplet.cells) {
            if (grid.cell(idx).size() > 1) {
                in_triplet |= grid.cell(idx);
            }
        }
        if (in_triplet.empty()) continue;

        const Candidates in_line = union_of(grid, triplet.line_sisters);
        const Candidates in_box = union_of(grid, triplet.box_sisters);

        for (auto d : in_triplet.values()) {
            bool line_has = in_line.contains(d);
            bool box_has = in_box.contains(d);

            // ボックス内ではトリプレットにしか置けない → ラインの他セルから除去
            if (line_has && !box_has) {
                count += remove_digit(grid, triplet.line_sisters, d);
            }
            // ライン上ではトリプレットにしか置けない → ボックスの他セルから除去
            if (box_has && !line_has) {
                count += remove_digit(grid, triplet.box_sisters, d);
            }
        }
    }

    return count;
}

} // namespace sudoku_csp
