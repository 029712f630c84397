#include "dpll_sat/formula.hpp"
#include <algorithm>

namespace dpll_sat {

size_t count_variables(const Formula& formula) {
    size_t n_vars = 0;
    for (const auto& clause : formula) {
        for (const auto& lit : clause) {
            if (lit.var_idx >= n_vars) {
                n_vars = lit.var_idx + 1;
            }
        }
    }
    return n_vars;
}

bool is_satisfied_by(const Formula& formula, const Assignment& assignment) {
    return std::all_of(formula.begin(), formula.end(), [&assignment](const Clause& clause) {
        return std::any_of(clause.begin(), clause.end(), [&assignment](const Literal& lit) {
            return assignment[lit.var_idx] == lit.truth();
        });
    });
}

std::ostream& operator<<(std::ostream& os, const Literal& lit) {
    return os << (lit.negated ? '-' : '+') << lit.var_idx;
}

std::ostream& operator<<(std::ostream& os, const Clause& clause) {
    os << "[";
    bool first = true;
    for (const auto& lit : clause) {
        if (!first) os << ", ";
        first = false;
        os << lit;
    }
    return os << "]";
}

} // namespace dpll_sat
