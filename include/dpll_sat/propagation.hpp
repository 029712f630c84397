/**
 * @file propagation.hpp
 * @brief 論理式の簡約と単位伝播
 */
#ifndef DPLL_SAT_PROPAGATION_HPP
#define DPLL_SAT_PROPAGATION_HPP

#include "dpll_sat/formula.hpp"

namespace dpll_sat {

/**
 * @brief 変数割当で論理式をその場で簡約
 *
 * 真になったリテラルを含む節を削除し、残りの節からは偽になったリテラルを
 * 全て取り除く。節・リテラルの削除は末尾との swap で行うため順序は保存されない。
 *
 * 偽リテラルだけからなる単位節は空節として残る（呼び出し側で矛盾として扱う）。
 *
 * @param formula 簡約する論理式
 * @param var_idx 割り当てる変数
 * @param truth 割り当てる値
 */
void simplify(Formula& formula, size_t var_idx, bool truth);

/**
 * @brief 単位節がなくなるまで単位伝播
 *
 * 論理式の先頭から最初に見つかった単位節の値を assignment に書き込み、
 * simplify() を呼ぶ。これを単位節がなくなるまで繰り返す。
 * 書き込んだ値は失敗しても元に戻さない。
 *
 * @return 伝播したリテラルの数
 */
size_t unit_propagate(Formula& formula, Assignment& assignment);

} // namespace dpll_sat

#endif // DPLL_SAT_PROPAGATION_HPP
