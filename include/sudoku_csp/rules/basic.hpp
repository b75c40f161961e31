/**
 * @file basic.hpp
 * @brief 基本ルール (eliminate_found, unique_cell)
 */
#ifndef SUDOKU_CSP_RULES_BASIC_HPP
#define SUDOKU_CSP_RULES_BASIC_HPP

#include "sudoku_csp/rule.hpp"

namespace sudoku_csp {

/**
 * @brief eliminate_found: 確定した数字を同じグループの他セルから除去
 */
class EliminateFoundRule : public Rule {
public:
    std::string name() const override;
    size_t apply(Grid& grid) override;
};

/**
 * @brief unique_cell: グループ内でその数字を許すセルが 1 つだけなら確定
 *
 * 既に確定しているセルは対象外。
 */
class UniqueCellRule : public Rule {
public:
    std::string name() const override;
    size_t apply(Grid& grid) override;
};

} // namespace sudoku_csp

#endif // SUDOKU_CSP_RULES_BASIC_HPP
