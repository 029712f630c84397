/**
 * @file branching.hpp
 * @brief 分岐変数の選択
 */
#ifndef DPLL_SAT_BRANCHING_HPP
#define DPLL_SAT_BRANCHING_HPP

#include "dpll_sat/formula.hpp"

namespace dpll_sat {

/**
 * @brief 論理式中で最も多く出現する変数を選択
 *
 * 正負を問わずリテラルの出現回数を数える（同じ節での重複も数える）。
 * 同数なら小さいインデックスを優先する。
 *
 * @param formula 単位伝播後の論理式
 * @param n_vars 変数の数（割当のサイズ）
 * @return 出現回数が最大の変数。どの変数も出現しなければ 0
 */
size_t dominant_variable(const Formula& formula, size_t n_vars);

} // namespace dpll_sat

#endif // DPLL_SAT_BRANCHING_HPP
