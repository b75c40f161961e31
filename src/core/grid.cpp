#include "sudoku_csp/grid.hpp"
#include <initializer_list>

namespace sudoku_csp {

// ============================================================================
// Layout implementation
// ============================================================================

const Layout& Layout::instance() {
    static const Layout layout;
    return layout;
}

Layout::Layout() {
    // 行・列
    for (size_t i = 0; i < GRID_SIZE; ++i) {
        Group& row = groups_[i];
        row.kind = GroupKind::Row;
        row.index = i;
        Group& col = groups_[GRID_SIZE + i];
        col.kind = GroupKind::Column;
        col.index = i;
        for (size_t j = 0; j < GRID_SIZE; ++j) {
            row.cells[j] = Grid::index_of(i, j);
            col.cells[j] = Grid::index_of(j, i);
        }
    }

    // ボックス（ボックス内は行優先）
    for (size_t b = 0; b < GRID_SIZE; ++b) {
        Group& box = groups_[2 * GRID_SIZE + b];
        box.kind = GroupKind::Box;
        box.index = b;
        size_t top = (b / BOX_SIZE) * BOX_SIZE;
        size_t left = (b % BOX_SIZE) * BOX_SIZE;
        for (size_t j = 0; j < GRID_SIZE; ++j) {
            box.cells[j] = Grid::index_of(top + j / BOX_SIZE, left + j % BOX_SIZE);
        }
    }

    // トリプレット: 行 → 列の順に、各ライン 3 区画ずつ
    size_t t_idx = 0;
    for (auto kind : {GroupKind::Row, GroupKind::Column}) {
        for (size_t line = 0; line < GRID_SIZE; ++line) {
            const Group& line_group = (kind == GroupKind::Row) ? row(line) : column(line);
            for (size_t seg = 0; seg < BOX_SIZE; ++seg) {
                Triplet& t = triplets_[t_idx++];
                t.line_kind = kind;
                t.line = line;
                t.box = (kind == GroupKind::Row)
                    ? box_of(line, seg * BOX_SIZE)
                    : box_of(seg * BOX_SIZE, line);

                size_t n_line = 0;
                for (size_t j = 0; j < GRID_SIZE; ++j) {
                    if (j / BOX_SIZE == seg) {
                        t.cells[j % BOX_SIZE] = line_group.cells[j];
                    } else {
                        t.line_sisters[n_line++] = line_group.cells[j];
                    }
                }

                // ボックス内でトリプレットに属さない 6 セル
                size_t n_box = 0;
                for (size_t idx : box(t.box).cells) {
                    size_t r = idx / GRID_SIZE;
                    size_t c = idx % GRID_SIZE;
                    size_t pos = (kind == GroupKind::Row) ? r : c;
                    if (pos != line) {
                        t.box_sisters[n_box++] = idx;
                    }
                }
            }
        }
    }
}

std::string Layout::group_name(size_t group_idx) {
    static const char kinds[] = {'R', 'C', 'S'};
    return std::string(1, kinds[group_idx / GRID_SIZE]) + std::to_string(group_idx % GRID_SIZE);
}

std::string Layout::triplet_name(size_t triplet_idx) {
    const Triplet& t = instance().triplets()[triplet_idx];
    std::string out = (t.line_kind == GroupKind::Row) ? "R" : "C";
    return out + std::to_string(t.line) + "S" + std::to_string(t.box);
}

// ============================================================================
// Grid implementation
// ============================================================================

Grid::Grid() {
    cells_.fill(Candidates::full());
}

Grid::Grid(const Puzzle& puzzle) {
    for (size_t r = 0; r < GRID_SIZE; ++r) {
        for (size_t c = 0; c < GRID_SIZE; ++c) {
            int v = puzzle[r][c];
            at(r, c) = (v == 0) ? Candidates::full() : Candidates::single(v);
        }
    }
}

size_t Grid::total_candidates() const {
    size_t total = 0;
    for (const auto& c : cells_) {
        total += c.size();
    }
    return total;
}

bool Grid::has_empty_cell() const {
    for (const auto& c : cells_) {
        if (c.empty()) return true;
    }
    return false;
}

bool Grid::is_solved() const {
    for (const auto& c : cells_) {
        if (!c.is_singleton()) return false;
    }
    return true;
}

std::optional<size_t> Grid::first_undetermined() const {
    for (size_t i = 0; i < CELL_COUNT; ++i) {
        if (cells_[i].size() > 1) {
            return i;
        }
    }
    return std::nullopt;
}

Puzzle Grid::to_puzzle() const {
    Puzzle puzzle{};
    for (size_t r = 0; r < GRID_SIZE; ++r) {
        for (size_t c = 0; c < GRID_SIZE; ++c) {
            puzzle[r][c] = at(r, c).value().value_or(0);
        }
    }
    return puzzle;
}

} // namespace sudoku_csp
