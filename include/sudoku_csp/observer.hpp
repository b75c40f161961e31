/**
 * @file observer.hpp
 * @brief 伝播・探索の通知インターフェースと verbose ログ出力
 */
#ifndef SUDOKU_CSP_OBSERVER_HPP
#define SUDOKU_CSP_OBSERVER_HPP

#include "sudoku_csp/propagator.hpp"
#include <ostream>

namespace sudoku_csp {

/**
 * @brief 伝播ループと探索から呼ばれる通知先
 *
 * 盤面は const 参照でのみ渡される。デフォルト実装は何もしない。
 */
class SolverObserver {
public:
    virtual ~SolverObserver() = default;

    /**
     * @brief 探索キューから状態を取り出した直後
     * @param remaining キューに残っている状態数
     */
    virtual void on_state_start(const Grid& /*grid*/, size_t /*remaining*/) {}

    /**
     * @brief 状態の伝播が終わった直後
     */
    virtual void on_state_end(PropagationStatus /*status*/, const Grid& /*grid*/,
                              size_t /*remaining*/) {}

    /**
     * @brief パス開始時
     * @param pass この伝播内でのパス番号（1 始まり）
     * @param total_candidates パス開始時の候補総数
     */
    virtual void on_pass_start(size_t /*pass*/, size_t /*total_candidates*/) {}

    /**
     * @brief ルールを 1 回適用した直後
     */
    virtual void on_rule_applied(const Rule& /*rule*/, size_t /*eliminated*/, const Grid& /*grid*/) {}

    /**
     * @brief パス終了時
     */
    virtual void on_pass_end(size_t /*pass*/, size_t /*eliminated*/, size_t /*total_before*/,
                             size_t /*total_after*/, const Grid& /*grid*/) {}

    /**
     * @brief 仮定した子状態をキューに積んだ直後
     * @param cell 仮定したセルのインデックス
     * @param digit 仮定した数字
     * @param queue_size 積んだ後のキューの長さ
     */
    virtual void on_branch(size_t /*cell*/, int /*digit*/, const Grid& /*child*/,
                           size_t /*queue_size*/) {}

    /**
     * @brief 解が見つかった時
     * @param count これまでに見つかった解の数
     */
    virtual void on_solution(const Grid& /*grid*/, size_t /*count*/) {}
};

/**
 * @brief ストリームへ "% " 付きで進捗を書き出す observer
 *
 * レベル:
 * - 1: 探索の要約（状態の取り出し・分岐・解）
 * - 2: パスとルールごとの除去数
 * - 3: 盤面ダンプ
 * - 4: トレース（除去のなかったルールと、ルール適用ごとの盤面）
 */
class VerboseObserver : public SolverObserver {
public:
    static constexpr int SUMMARY = 1;
    static constexpr int DETAIL = 2;
    static constexpr int DEBUG = 3;
    static constexpr int TRACE = 4;

    VerboseObserver(std::ostream& os, int level);

    int level() const { return level_; }

    void on_state_start(const Grid& grid, size_t remaining) override;
    void on_state_end(PropagationStatus status, const Grid& grid, size_t remaining) override;
    void on_pass_start(size_t pass, size_t total_candidates) override;
    void on_rule_applied(const Rule& rule, size_t eliminated, const Grid& grid) override;
    void on_pass_end(size_t pass, size_t eliminated,
                     size_t total_before, size_t total_after, const Grid& grid) override;
    void on_branch(size_t cell, int digit, const Grid& child, size_t queue_size) override;
    void on_solution(const Grid& grid, size_t count) override;

private:
    /**
     * @brief 複数行テキストを各行 "% " 付きで出力
     */
    void dump(const std::string& text);

    std::ostream& os_;
    int level_;
    size_t state_count_ = 0;
};

} // namespace sudoku_csp

#endif // SUDOKU_CSP_OBSERVER_HPP
