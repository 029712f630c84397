/**
 * @file formula.hpp
 * @brief CNF論理式の表現（リテラル・節・論理式・割当）
 */
#ifndef DPLL_SAT_FORMULA_HPP
#define DPLL_SAT_FORMULA_HPP

#include <cstddef>
#include <ostream>
#include <vector>

namespace dpll_sat {

/**
 * @brief リテラル（変数インデックスと極性のペア）
 *
 * 変数インデックスは 0 始まり。
 * negated == false なら変数が真のとき、true なら偽のときに真となる。
 */
struct Literal {
    size_t var_idx;
    bool negated;

    static Literal positive(size_t var_idx) { return Literal{var_idx, false}; }
    static Literal negative(size_t var_idx) { return Literal{var_idx, true}; }

    /**
     * @brief このリテラルを真にする変数の値
     */
    bool truth() const { return !negated; }

    Literal operator~() const { return Literal{var_idx, !negated}; }

    bool operator==(const Literal& other) const {
        return var_idx == other.var_idx && negated == other.negated;
    }

    bool operator!=(const Literal& other) const {
        return !(*this == other);
    }
};

/**
 * @brief 節（リテラルの論理和）
 *
 * 空の節は偽、リテラルが1つの節は単位節。
 * 節内の順序に意味はない。
 */
using Clause = std::vector<Literal>;

/**
 * @brief CNF論理式（節の論理積）
 *
 * 空の論理式は真。重複リテラルはそのまま保持する。
 */
using Formula = std::vector<Clause>;

/**
 * @brief 変数割当（i 番目の要素が変数 i の値）
 */
using Assignment = std::vector<bool>;

/**
 * @brief 論理式が参照する変数の数（最大インデックス + 1）
 * @return リテラルを1つも含まなければ 0
 */
size_t count_variables(const Formula& formula);

/**
 * @brief 割当が全ての節を満たすか検証
 * @pre 全リテラルの変数インデックスが assignment.size() 未満であること
 */
bool is_satisfied_by(const Formula& formula, const Assignment& assignment);

// 診断出力用: +3 / -3（0 始まり）, [+0, -1]
std::ostream& operator<<(std::ostream& os, const Literal& lit);
std::ostream& operator<<(std::ostream& os, const Clause& clause);

} // namespace dpll_sat

#endif // DPLL_SAT_FORMULA_HPP
