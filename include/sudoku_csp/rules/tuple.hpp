/**
 * @file tuple.hpp
 * @brief タプルルール (naked_tuple, hidden_tuple)
 */
#ifndef SUDOKU_CSP_RULES_TUPLE_HPP
#define SUDOKU_CSP_RULES_TUPLE_HPP

#include "sudoku_csp/rule.hpp"

namespace sudoku_csp {

/**
 * @brief naked_tuple: k 個のセルが k 個の数字に閉じ込められている
 *
 * 未確定セル S（候補数 k）について、グループ内で候補集合が S の部分集合である
 * セル（S 自身を含む）がちょうど k 個なら、S の数字はその k セルで使い切られる。
 * S と交わる残りのセルから S の数字を除去する。
 */
class NakedTupleRule : public Rule {
public:
    std::string name() const override;
    size_t apply(Grid& grid) override;
};

/**
 * @brief hidden_tuple: k 個の数字が k 個のセルに閉じ込められている
 *
 * 未確定セル S（候補数 k）について、S の上位集合であるセルがちょうど k 個で、
 * S と部分的に交わる（交わるが上位集合でない）セルがなければ、
 * その k セルは S の数字しか取れない。S より大きい上位集合セルを S に絞り込む。
 */
class HiddenTupleRule : public Rule {
public:
    std::string name() const override;
    size_t apply(Grid& grid) override;
};

} // namespace sudoku_csp

#endif // SUDOKU_CSP_RULES_TUPLE_HPP
