/**
 * @file fish.hpp
 * @brief フィッシュ系ルール (x_wing, swordfish)
 */
#ifndef SUDOKU_CSP_RULES_FISH_HPP
#define SUDOKU_CSP_RULES_FISH_HPP

#include "sudoku_csp/rule.hpp"
#include <array>

namespace sudoku_csp {

/**
 * @brief x_wing: 2 本の平行ラインで数字の位置が同じ 2 箇所に限られる
 *
 * 行 a, b のどちらでも数字 n を許すセル（確定セルを含む）が同じ 2 列だけなら、
 * その 2 列の他の行から n を除去する。列と行を入れ替えても同様。
 */
class XWingRule : public Rule {
public:
    std::string name() const override;
    size_t apply(Grid& grid) override;

private:
    /**
     * @brief ライン対 1 組に対する適用
     * @param perps 直交ライン（列または行）の先頭グループ番号
     */
    size_t apply_pair(Grid& grid, const Group& line1, const Group& line2, size_t perps);
};

/**
 * @brief swordfish: 3 本の平行ラインへの x_wing の一般化
 *
 * 行 a, b, c の未確定セルにおける数字 n の位置が各行 2 箇所以上あり、
 * その和集合がちょうど 3 列なら、その 3 列の他のセルから n を除去する。
 * 3 行のいずれかで n が既に確定している組は対象外。
 * 残すセルはセル番号で判定する（候補集合が等しいだけのセルは残さない）。
 */
class SwordfishRule : public Rule {
public:
    std::string name() const override;
    size_t apply(Grid& grid) override;

private:
    size_t apply_trio(Grid& grid, const std::array<const Group*, 3>& lines, size_t perps);
};

} // namespace sudoku_csp

#endif // SUDOKU_CSP_RULES_FISH_HPP
