#include "dpll_sat/solver.hpp"
#include "dpll_sat/branching.hpp"
#include "dpll_sat/propagation.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace dpll_sat {

std::optional<Assignment> Solver::solve(const Formula& formula) {
    stats_ = SolverStats{};

    const size_t n_vars = count_variables(formula);
    Assignment assignment(n_vars, false);

    if (verbose_) {
        std::cerr << "c [verbose] search start: " << formula.size()
                  << " clauses, " << n_vars << " variables\n";
    }

    if (!dpll(formula, assignment, 0)) {
        if (verbose_) {
            std::cerr << "c [verbose] unsatisfiable after "
                      << stats_.conflicts << " conflicts\n";
        }
        return std::nullopt;
    }

    if (verbose_) {
        std::cerr << "c [verbose] satisfiable: decisions=" << stats_.decisions
                  << " max_depth=" << stats_.max_depth << "\n";
    }

    if (verify_solution_ && !is_satisfied_by(formula, assignment)) {
        throw std::logic_error("assignment does not satisfy the formula");
    }

    return assignment;
}

bool Solver::dpll(const Formula& formula, Assignment& assignment, size_t depth) {
    // 分岐ごとに節の状態を独立させる
    Formula working = formula;

    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    stats_.propagations += unit_propagate(working, assignment);

    if (working.empty()) {
        return true;
    }

    bool has_empty = std::any_of(working.begin(), working.end(),
                                 [](const Clause& clause) { return clause.empty(); });
    if (has_empty) {
        stats_.conflicts++;
        if (verbose_) {
            std::cerr << "c [verbose] conflict at depth " << depth << "\n";
        }
        return false;
    }

    const size_t var = dominant_variable(working, assignment.size());
    stats_.decisions++;

    working.push_back(Clause{Literal::positive(var)});
    if (dpll(working, assignment, depth + 1)) {
        return true;
    }

    working.back() = Clause{Literal::negative(var)};
    return dpll(working, assignment, depth + 1);
}

std::optional<Assignment> check_sat(const Formula& formula) {
    Solver solver;
    return solver.solve(formula);
}

} // namespace dpll_sat
