/**
 * @file solver.hpp
 * @brief DPLLソルバークラス（単位伝播、最頻出変数による分岐）
 */
#ifndef DPLL_SAT_SOLVER_HPP
#define DPLL_SAT_SOLVER_HPP

#include "dpll_sat/formula.hpp"
#include <optional>

namespace dpll_sat {

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t decisions = 0;
    size_t propagations = 0;
    size_t conflicts = 0;
    size_t max_depth = 0;
};

/**
 * @brief DPLLソルバー
 *
 * 再帰呼び出しごとに論理式を複製し、単位伝播の後に最頻出変数で分岐する。
 * 分岐は常に真を先に試す。
 * 割当バッファは探索経路全体で共有し、失敗した分岐の書き込みは戻さない。
 * 成功した経路の書き込みが最後に残るので、返す割当は常に論理式を満たす。
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 充足可能性を判定
     * @param formula 解く論理式
     * @return 充足可能なら割当（サイズは count_variables(formula)）、
     *         充足不能なら std::nullopt
     */
    std::optional<Assignment> solve(const Formula& formula);

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief 解の検証を有効/無効にする
     *
     * 有効な場合、solve() は返す前に割当が入力を満たすことを確認し、
     * 満たさなければ std::logic_error を投げる。
     */
    void set_verify_solution(bool enabled) { verify_solution_ = enabled; }

private:
    /**
     * @brief 再帰探索
     * @param formula 呼び出し元の論理式（内部で複製する）
     * @param assignment 共有の割当バッファ
     * @param depth 分岐の深さ
     */
    bool dpll(const Formula& formula, Assignment& assignment, size_t depth);

    bool verbose_ = false;
    bool verify_solution_ = false;

    SolverStats stats_;
};

/**
 * @brief 既定設定のソルバーで充足可能性を判定
 */
std::optional<Assignment> check_sat(const Formula& formula);

} // namespace dpll_sat

#endif // DPLL_SAT_SOLVER_HPP
