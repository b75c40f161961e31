/**
 * @file intersection.hpp
 * @brief 交差ルール (locked_candidates)
 */
#ifndef SUDOKU_CSP_RULES_INTERSECTION_HPP
#define SUDOKU_CSP_RULES_INTERSECTION_HPP

#include "sudoku_csp/rule.hpp"

namespace sudoku_csp {

/**
 * @brief locked_candidates: トリプレット上の数字の所在による除去
 *
 * トリプレットの未確定セルにある数字が、ライン側の姉妹セルにあって
 * ボックス側の姉妹セルにない場合、その数字はボックス内ではトリプレットに入るしかない。
 * よってライン側の姉妹セルから除去する。逆の場合はボックス側から除去する。
 * 姉妹セルの和集合はトリプレットごとに除去前に 1 回だけ計算する。
 */
class LockedCandidatesRule : public Rule {
public:
    std::string name() const override;
    size_t apply(Grid& grid) override;
};

} // namespace sudoku_csp

#endif // SUDOKU_CSP_RULES_INTERSECTION_HPP
