/**
 * @file solver.hpp
 * @brief 数独ソルバー（伝播 + 仮定による探索）
 */
#ifndef SUDOKU_CSP_SOLVER_HPP
#define SUDOKU_CSP_SOLVER_HPP

#include "sudoku_csp/propagator.hpp"
#include "sudoku_csp/puzzle.hpp"
#include <deque>
#include <functional>
#include <optional>
#include <vector>

namespace sudoku_csp {

class SolverObserver;  // forward declaration

/**
 * @brief 解のコールバック関数型
 * @return trueを返すと探索を継続、falseで停止
 */
using SolutionCallback = std::function<bool(const Puzzle&)>;

/**
 * @brief 求解結果の分類
 */
enum class SolveStatus {
    Unique,             // 解がただ 1 つ
    NoSolution,         // 解なし
    MultipleSolutions   // 解が複数（正しい数独ではない）
};

/**
 * @brief 分類名 ("unique", "no_solution", "multiple_solutions")
 */
const char* to_string(SolveStatus status);

/**
 * @brief 探索キューの取り出し順
 */
enum class SearchOrder {
    DepthFirst,     // 最後に積んだ状態から（LIFO）
    BreadthFirst    // 最初に積んだ状態から（FIFO）
};

/**
 * @brief 求解結果
 */
struct SolveResult {
    SolveStatus status = SolveStatus::NoSolution;
    std::optional<Puzzle> solution;   // status == Unique の時のみ
    std::vector<Puzzle> solutions;    // 見つかった解（解数の上限まで）
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t states = 0;          // 伝播した状態数
    size_t branches = 0;        // 仮定して積んだ子状態数
    size_t contradictions = 0;  // 矛盾で捨てた状態数
    size_t solutions = 0;       // 見つかった解の数
    size_t max_queue_size = 0;
    PropagationStats propagation;
};

/**
 * @brief 数独ソルバー
 *
 * 盤面状態のキューを持ち、取り出した状態を Propagator で不動点まで伝播する。
 * 未完了なら行優先で最初の未確定セルを選び、残っている数字ごとに
 * その数字に固定した複製を積む（同じ親からは数字の昇順に探索される）。
 * 各状態は独立した Grid の値なので、分岐間で状態は共有されない。
 *
 * 既定の探索順は深さ優先（LIFO）。幅優先（FIFO）は
 * set_search_order(SearchOrder::BreadthFirst) で選べる。
 */
class Solver {
public:
    /// 解数の上限の既定値（一意かどうかの判定に必要な最小数）
    static constexpr size_t DEFAULT_SOLUTION_LIMIT = 2;

    Solver();

    /**
     * @brief 伝播ループを指定して作成
     */
    explicit Solver(Propagator propagator);

    /**
     * @brief パズルを解く
     *
     * 解数の上限に達したら探索を打ち切る。上限 1 は 2 として扱う。
     *
     * @param puzzle 検証済みのパズル
     */
    SolveResult solve(const Puzzle& puzzle);

    /**
     * @brief 未検証の行リストを検証してから解く
     * @throws MalformedInput 形状または値が不正な場合
     */
    SolveResult solve(const PuzzleRows& rows);

    /**
     * @brief 解を列挙
     * @param puzzle 検証済みのパズル
     * @param callback 解が見つかるたびに呼ばれるコールバック
     * @return 見つかった解の数
     */
    size_t solve_all(const Puzzle& puzzle, SolutionCallback callback);

    /**
     * @brief 探索順を設定（既定は DepthFirst）
     */
    void set_search_order(SearchOrder order) { order_ = order; }
    SearchOrder search_order() const { return order_; }

    /**
     * @brief solve() の解数の上限を設定（0 = 無制限）
     */
    void set_solution_limit(size_t limit) { solution_limit_ = limit; }
    size_t solution_limit() const { return solution_limit_; }

    /**
     * @brief 通知先を設定（nullptr で無効、所有しない）
     */
    void set_observer(SolverObserver* observer);

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

private:
    /**
     * @brief 最初の未確定セルで分岐して子状態を積む
     */
    void branch(const Grid& grid, std::deque<Grid>& queue);

    /**
     * @brief 探索順に従ってキューから状態を取り出す
     */
    Grid pop(std::deque<Grid>& queue) const;

    Propagator propagator_;
    SearchOrder order_ = SearchOrder::DepthFirst;
    size_t solution_limit_ = DEFAULT_SOLUTION_LIMIT;
    SolverObserver* observer_ = nullptr;
    SolverStats stats_;
};

/**
 * @brief 既定設定のソルバーでパズルを解く
 */
SolveResult solve(const Puzzle& puzzle);

} // namespace sudoku_csp

#endif // SUDOKU_CSP_SOLVER_HPP
