/**
 * @file grid.hpp
 * @brief 盤面（81 セル）と、行・列・ボックス・トリプレットのビュー
 */
#ifndef SUDOKU_CSP_GRID_HPP
#define SUDOKU_CSP_GRID_HPP

#include "sudoku_csp/candidates.hpp"
#include "sudoku_csp/puzzle.hpp"
#include <array>
#include <optional>
#include <string>

namespace sudoku_csp {

/// グループ数（9 行 + 9 列 + 9 ボックス）
constexpr size_t GROUP_COUNT = 27;

/// トリプレット数（行トリプレット 27 + 列トリプレット 27）
constexpr size_t TRIPLET_COUNT = 54;

/**
 * @brief グループの種類
 */
enum class GroupKind {
    Row,
    Column,
    Box
};

/**
 * @brief 9 セルのグループ（行・列・ボックス）
 *
 * セルは保持せず、Grid 内のインデックスだけを持つ。
 * ボックスのセルはボックス内で行優先順。
 */
struct Group {
    GroupKind kind;
    size_t index;                        // 種類内の番号 (0..8)
    std::array<size_t, GRID_SIZE> cells;
};

/**
 * @brief ボックスと行（または列）の交差 3 セル
 *
 * line_sisters: 同じ行（列）の残り 6 セル
 * box_sisters:  同じボックスの残り 6 セル
 */
struct Triplet {
    GroupKind line_kind;                 // Row または Column
    size_t line;                         // 行番号または列番号
    size_t box;                          // ボックス番号
    std::array<size_t, 3> cells;
    std::array<size_t, 6> line_sisters;
    std::array<size_t, 6> box_sisters;
};

/**
 * @brief 全盤面で共有される不変のビュー表
 *
 * グループ番号は 行 0-8, 列 9-17, ボックス 18-26。
 * トリプレット番号は 行トリプレット 0-26 (3*行 + 区画), 列トリプレット 27-53 (27 + 3*列 + 区画)。
 */
class Layout {
public:
    /**
     * @brief 唯一のインスタンスを取得
     */
    static const Layout& instance();

    const std::array<Group, GROUP_COUNT>& groups() const { return groups_; }
    const std::array<Triplet, TRIPLET_COUNT>& triplets() const { return triplets_; }

    const Group& row(size_t r) const { return groups_[r]; }
    const Group& column(size_t c) const { return groups_[GRID_SIZE + c]; }
    const Group& box(size_t b) const { return groups_[2 * GRID_SIZE + b]; }

    /**
     * @brief セル (row, col) を含むボックス番号
     */
    static size_t box_of(size_t row, size_t col) {
        return (row / BOX_SIZE) * BOX_SIZE + col / BOX_SIZE;
    }

    /**
     * @brief ログ用のグループ名 ("R0", "C3", "S8")
     */
    static std::string group_name(size_t group_idx);

    /**
     * @brief ログ用のトリプレット名 ("R4S5", "C2S6")
     */
    static std::string triplet_name(size_t triplet_idx);

private:
    Layout();

    std::array<Group, GROUP_COUNT> groups_;
    std::array<Triplet, TRIPLET_COUNT> triplets_;
};

/**
 * @brief 81 セルの候補集合を所有する盤面
 *
 * 探索の各状態はこのクラスの値で表す。ビューは Layout に共有されるため、
 * 状態の複製はセル配列のコピーだけで済み、複製同士は完全に独立している。
 */
class Grid {
public:
    /**
     * @brief 全セルが {1..9} の盤面を作成
     */
    Grid();

    /**
     * @brief 検証済みの Puzzle から作成
     *
     * 0 のセルは {1..9}、数字のセルはその数字の単一集合になる。
     */
    explicit Grid(const Puzzle& puzzle);

    /**
     * @brief (row, col) のフラットインデックス
     */
    static size_t index_of(size_t row, size_t col) { return row * GRID_SIZE + col; }

    Candidates& cell(size_t idx) { return cells_[idx]; }
    const Candidates& cell(size_t idx) const { return cells_[idx]; }

    Candidates& at(size_t row, size_t col) { return cells_[index_of(row, col)]; }
    const Candidates& at(size_t row, size_t col) const { return cells_[index_of(row, col)]; }

    const std::array<Candidates, CELL_COUNT>& cells() const { return cells_; }

    /**
     * @brief ビュー表への参照
     */
    const Layout& layout() const { return Layout::instance(); }

    /**
     * @brief 全セルの候補数の合計（81 なら全て確定）
     */
    size_t total_candidates() const;

    /**
     * @brief 候補が空のセルがあるか（矛盾）
     */
    bool has_empty_cell() const;

    /**
     * @brief 全セルが単一数字に確定しているか
     */
    bool is_solved() const;

    /**
     * @brief 行優先順で最初の未確定セル
     * @return 未確定セルのインデックス、なければ std::nullopt
     */
    std::optional<size_t> first_undetermined() const;

    /**
     * @brief 数字盤面に変換（未確定・空のセルは 0）
     */
    Puzzle to_puzzle() const;

    bool operator==(const Grid& other) const { return cells_ == other.cells_; }
    bool operator!=(const Grid& other) const { return !(*this == other); }

private:
    std::array<Candidates, CELL_COUNT> cells_;
};

} // namespace sudoku_csp

#endif // SUDOKU_CSP_GRID_HPP
