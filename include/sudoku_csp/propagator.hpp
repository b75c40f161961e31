/**
 * @file propagator.hpp
 * @brief 推論ルールを不動点まで適用する伝播ループ
 */
#ifndef SUDOKU_CSP_PROPAGATOR_HPP
#define SUDOKU_CSP_PROPAGATOR_HPP

#include "sudoku_csp/rule.hpp"
#include <string>
#include <vector>

namespace sudoku_csp {

class SolverObserver;  // forward declaration

/**
 * @brief 伝播結果の分類
 */
enum class PropagationStatus {
    InProgress,     // 未確定セルが残っている
    Solved,         // 全セルが確定
    Contradiction   // 候補が空のセルがある
};

/**
 * @brief 分類名 ("in_progress", "solved", "contradiction")
 */
const char* to_string(PropagationStatus status);

/**
 * @brief ルールごとの統計
 */
struct RuleStats {
    std::string name;
    size_t invocations = 0;
    size_t eliminations = 0;
};

/**
 * @brief 伝播統計
 */
struct PropagationStats {
    size_t runs = 0;      // propagate() の呼び出し回数
    size_t passes = 0;    // 全パス数
    std::vector<RuleStats> rules;
};

/**
 * @brief 伝播ループ
 *
 * 1 パスでルールを優先順に適用する。先頭 eager_count 個のルールは毎パス実行し、
 * それ以降のルールはそのパスでまだ何も除去されていない間だけ実行する
 * （安いルールが進展したら高価なルールは次のパスへ回す）。
 * パスが何も除去しなくなるか、空のセルが生じたら停止して盤面を分類する。
 *
 * 各パスで候補総数が真に減少し、81 未満にはならないため必ず停止する。
 */
class Propagator {
public:
    /// 毎パス実行する先頭ルール数（eliminate_found, unique_cell）
    static constexpr size_t DEFAULT_EAGER_COUNT = 2;

    /**
     * @brief 標準ルール列で作成
     */
    Propagator();

    /**
     * @brief ルール列を指定して作成
     * @param rules 適用順のルール列
     * @param eager_count 毎パス実行する先頭ルール数
     */
    Propagator(std::vector<RulePtr> rules, size_t eager_count);

    /**
     * @brief 盤面を不動点まで伝播
     * @return 伝播後の盤面の分類
     */
    PropagationStatus propagate(Grid& grid);

    /**
     * @brief 盤面を分類（変更しない）
     */
    static PropagationStatus classify(const Grid& grid);

    /**
     * @brief 通知先を設定（nullptr で無効）
     */
    void set_observer(SolverObserver* observer) { observer_ = observer; }

    const std::vector<RulePtr>& rules() const { return rules_; }

    size_t eager_count() const { return eager_count_; }

    /**
     * @brief 統計情報を取得
     */
    const PropagationStats& stats() const { return stats_; }

    /**
     * @brief 統計情報をリセット
     */
    void reset_stats();

private:
    std::vector<RulePtr> rules_;
    size_t eager_count_;
    SolverObserver* observer_ = nullptr;
    PropagationStats stats_;
};

} // namespace sudoku_csp

#endif // SUDOKU_CSP_PROPAGATOR_HPP
