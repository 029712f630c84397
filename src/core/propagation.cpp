#include "dpll_sat/propagation.hpp"
#include <algorithm>

namespace dpll_sat {

void simplify(Formula& formula, size_t var_idx, bool truth) {
    const Literal true_lit{var_idx, !truth};
    const Literal false_lit = ~true_lit;

    // ソルバーで最も重い処理なので、新しい節を作らずにその場で削除する
    size_t clause_idx = 0;
    while (clause_idx < formula.size()) {
        Clause& clause = formula[clause_idx];

        // 充足された節を削除
        if (std::find(clause.begin(), clause.end(), true_lit) != clause.end()) {
            if (clause_idx != formula.size() - 1) {
                std::swap(clause, formula.back());
            }
            formula.pop_back();
            continue;
        }

        // 偽リテラルを削除
        size_t lit_idx = 0;
        while (lit_idx < clause.size()) {
            if (clause[lit_idx] == false_lit) {
                clause[lit_idx] = clause.back();
                clause.pop_back();
                continue;
            }
            ++lit_idx;
        }

        ++clause_idx;
    }
}

size_t unit_propagate(Formula& formula, Assignment& assignment) {
    size_t count = 0;
    while (true) {
        auto it = std::find_if(formula.begin(), formula.end(),
                               [](const Clause& clause) { return clause.size() == 1; });
        if (it == formula.end()) {
            break;
        }
        const Literal lit = it->front();
        assignment[lit.var_idx] = lit.truth();
        simplify(formula, lit.var_idx, lit.truth());
        ++count;
    }
    return count;
}

} // namespace dpll_sat
