/**
 * @file rule.hpp
 * @brief 推論ルール基底クラスと全ルールヘッダのインクルード
 */
#ifndef SUDOKU_CSP_RULE_HPP
#define SUDOKU_CSP_RULE_HPP

#include "sudoku_csp/grid.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sudoku_csp {

/**
 * @brief 推論ルールの基底クラス
 *
 * ルールは状態を持たず、盤面の候補集合を直接削る。
 * 候補を増やすことは決してない。不動点にある盤面に適用した場合は
 * 何も変更せず 0 を返す。実行するかどうかは Propagator が決める。
 */
class Rule {
public:
    virtual ~Rule() = default;

    /**
     * @brief ルール名を取得
     */
    virtual std::string name() const = 0;

    /**
     * @brief ルールを盤面に 1 回適用
     * @return 除去した候補の個数
     */
    virtual size_t apply(Grid& grid) = 0;
};

using RulePtr = std::shared_ptr<Rule>;

/**
 * @brief 標準のルール列（コストの低い順）
 *
 * eliminate_found, unique_cell, naked_tuple, hidden_tuple,
 * locked_candidates, x_wing, swordfish
 */
std::vector<RulePtr> default_rules();

} // namespace sudoku_csp

// 各ルールグループのヘッダをインクルード
#include "sudoku_csp/rules/basic.hpp"
#include "sudoku_csp/rules/tuple.hpp"
#include "sudoku_csp/rules/intersection.hpp"
#include "sudoku_csp/rules/fish.hpp"

#endif // SUDOKU_CSP_RULE_HPP
