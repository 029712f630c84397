#include <catch2/catch.hpp>
#include "dpll_sat/branching.hpp"
#include "dpll_sat/propagation.hpp"
#include "dpll_sat/solver.hpp"
#include <algorithm>

using namespace dpll_sat;

namespace {
Literal P(size_t v) { return Literal::positive(v); }
Literal N(size_t v) { return Literal::negative(v); }

// 節内・論理式内の順序を無視して比較するための正規化
Formula normalized(Formula f) {
    auto lit_less = [](const Literal& a, const Literal& b) {
        return a.var_idx != b.var_idx ? a.var_idx < b.var_idx : a.negated < b.negated;
    };
    for (auto& clause : f) {
        std::sort(clause.begin(), clause.end(), lit_less);
    }
    std::sort(f.begin(), f.end(), [&lit_less](const Clause& a, const Clause& b) {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), lit_less);
    });
    return f;
}
}

// ============================================================================
// simplify tests
// ============================================================================

TEST_CASE("simplify removes satisfied clauses and false literals", "[propagation][simplify]") {
    SECTION("positive assignment") {
        Formula f = {{P(1), P(2)}, {N(1), P(3)}};
        simplify(f, 1, true);
        REQUIRE(f == Formula{{P(3)}});
    }

    SECTION("negative assignment") {
        Formula f = {{P(1), P(2)}, {N(1), P(3)}};
        simplify(f, 1, false);
        REQUIRE(f == Formula{{P(2)}});
    }

    SECTION("unrelated clauses are untouched") {
        Formula f = {{P(0), N(2)}, {P(3)}};
        simplify(f, 1, true);
        REQUIRE(f == Formula{{P(0), N(2)}, {P(3)}});
    }

    SECTION("every satisfied clause is removed") {
        Formula f = {{P(0)}, {P(0), P(1)}, {P(2), P(0)}, {N(0), P(1)}};
        simplify(f, 0, true);
        REQUIRE(f == Formula{{P(1)}});
    }
}

TEST_CASE("simplify leaves an empty clause for a falsified unit clause", "[propagation][simplify]") {
    Formula f = {{P(1)}, {P(2)}};
    simplify(f, 1, false);
    REQUIRE(normalized(f) == normalized(Formula{{}, {P(2)}}));
}

TEST_CASE("simplify strips every duplicate of the false literal", "[propagation][simplify]") {
    Formula with_dups = {{N(0), P(1), N(0), N(0)}, {P(2), P(0), P(0)}};
    Formula without_dups = {{N(0), P(1)}, {P(2), P(0)}};

    SECTION("assign true") {
        simplify(with_dups, 0, true);
        simplify(without_dups, 0, true);
        REQUIRE(with_dups == Formula{{P(1)}});
        REQUIRE(normalized(with_dups) == normalized(without_dups));
    }

    SECTION("assign false") {
        simplify(with_dups, 0, false);
        simplify(without_dups, 0, false);
        REQUIRE(normalized(with_dups) == normalized(Formula{{P(2)}}));
        REQUIRE(normalized(with_dups) == normalized(without_dups));
    }
}

TEST_CASE("simplify keeps tautologies until assigned", "[propagation][simplify]") {
    Formula f = {{P(0), N(0)}, {P(1)}};

    simplify(f, 1, true);
    REQUIRE(f == Formula{{P(0), N(0)}});

    simplify(f, 0, false);
    REQUIRE(f.empty());
}

// ============================================================================
// unit_propagate tests
// ============================================================================

TEST_CASE("unit_propagate resolves chained unit clauses", "[propagation][unit]") {
    Formula f = {
        {P(1)},               // 単位節
        {N(2)},               // 単位節
        {P(1), P(2)},         // => 充足
        {N(1), P(2), P(3)},   // => 3（単位節）
        {P(0), N(3), P(4)},   // => 0 | 4
    };
    Assignment vars(5, false);

    size_t count = unit_propagate(f, vars);

    REQUIRE(count == 3);
    REQUIRE(f == Formula{{P(0), P(4)}});
    REQUIRE(vars == Assignment{false, true, false, true, false});
}

TEST_CASE("unit_propagate without unit clauses is a no-op", "[propagation][unit]") {
    Formula f = {{P(0), P(1)}, {N(0), N(1)}};
    Assignment vars(2, false);

    REQUIRE(unit_propagate(f, vars) == 0);
    REQUIRE(f == Formula{{P(0), P(1)}, {N(0), N(1)}});
}

TEST_CASE("unit_propagate stops with an empty clause on contradiction", "[propagation][unit]") {
    Formula f = {{P(0)}, {N(0)}, {P(1), P(2)}};
    Assignment vars(3, false);

    unit_propagate(f, vars);

    REQUIRE(vars[0] == true);
    bool has_empty = std::any_of(f.begin(), f.end(),
                                 [](const Clause& c) { return c.empty(); });
    REQUIRE(has_empty);
}

// ============================================================================
// dominant_variable tests
// ============================================================================

TEST_CASE("dominant_variable picks the most frequent variable", "[branching]") {
    Formula f = {
        {P(0), P(1), P(2)},
        {N(0), P(1)},
        {N(1), P(2)},
        {P(0), N(1), N(2)},
    };
    REQUIRE(dominant_variable(f, 3) == 1);
}

TEST_CASE("dominant_variable tie-break and degenerate cases", "[branching]") {
    SECTION("lowest index wins on ties") {
        Formula f = {{P(2), N(1)}, {N(2), P(1)}};
        REQUIRE(dominant_variable(f, 3) == 1);
    }

    SECTION("duplicate occurrences count") {
        Formula f = {{P(0), P(1), P(1)}, {P(0)}, {N(1)}};
        REQUIRE(dominant_variable(f, 2) == 1);
    }

    SECTION("no occurrences yields zero") {
        REQUIRE(dominant_variable(Formula{}, 1) == 0);
        REQUIRE(dominant_variable(Formula{}, 0) == 0);
    }
}

// ============================================================================
// check_sat / Solver tests
// ============================================================================

TEST_CASE("check_sat on empty formula", "[solver]") {
    auto result = check_sat(Formula{});
    REQUIRE(result.has_value());
    REQUIRE(result->empty());
}

TEST_CASE("check_sat on satisfiable formula", "[solver]") {
    Formula f = {
        {P(0), P(0), P(1)},
        {N(0), N(1), N(1)},
        {N(0), P(1), P(1)},
    };
    auto result = check_sat(f);
    REQUIRE(result.has_value());
    REQUIRE(*result == Assignment{false, true});
    REQUIRE(is_satisfied_by(f, *result));
}

TEST_CASE("check_sat on unsatisfiable formula", "[solver]") {
    // 3 変数の XOR 制約の循環
    Formula f = {
        {P(0), P(1)}, {N(0), N(1)},
        {P(1), P(2)}, {N(1), N(2)},
        {P(2), P(0)}, {N(2), N(0)},
    };
    REQUIRE_FALSE(check_sat(f).has_value());
}

TEST_CASE("check_sat with an empty clause is unsatisfiable", "[solver]") {
    SECTION("alone") {
        REQUIRE_FALSE(check_sat(Formula{{}}).has_value());
    }

    SECTION("among satisfiable clauses") {
        Formula f = {{P(0), P(1)}, {}, {N(1)}};
        REQUIRE_FALSE(check_sat(f).has_value());
    }
}

TEST_CASE("check_sat witness sized by highest referenced variable", "[solver]") {
    Formula f = {{N(3)}, {P(1), P(3)}};
    auto result = check_sat(f);
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 4);
    REQUIRE((*result)[1] == true);
    REQUIRE((*result)[3] == false);
}

TEST_CASE("check_sat requires backtracking", "[solver]") {
    // x0 を真にすると矛盾し、偽に戻す必要がある
    Formula f = {
        {N(0), P(1)}, {N(0), N(1)},
        {P(0), P(2)}, {P(0), P(3)},
        {N(2), N(3), P(4)},
        {N(0), P(2)},
    };
    auto result = check_sat(f);
    REQUIRE(result.has_value());
    REQUIRE((*result)[0] == false);
    REQUIRE(is_satisfied_by(f, *result));
}

TEST_CASE("check_sat pigeonhole 3 into 2 is unsatisfiable", "[solver]") {
    // p(i, j): 鳩 i が穴 j に入る, 変数 2*i + j
    auto p = [](size_t i, size_t j) { return 2 * i + j; };
    Formula f;
    for (size_t i = 0; i < 3; ++i) {
        f.push_back({P(p(i, 0)), P(p(i, 1))});
    }
    for (size_t j = 0; j < 2; ++j) {
        for (size_t a = 0; a < 3; ++a) {
            for (size_t b = a + 1; b < 3; ++b) {
                f.push_back({N(p(a, j)), N(p(b, j))});
            }
        }
    }
    REQUIRE_FALSE(check_sat(f).has_value());
}

TEST_CASE("check_sat is deterministic", "[solver]") {
    Formula f = {
        {P(0), N(2), P(4)}, {N(1), P(3)}, {P(2), P(3), N(4)},
        {N(0), N(3)}, {P(1), P(4)}, {N(2), N(4), P(0)},
    };
    auto first = check_sat(f);
    auto second = check_sat(f);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(*first == *second);
    REQUIRE(is_satisfied_by(f, *first));
}

TEST_CASE("check_sat does not modify the input formula", "[solver]") {
    Formula f = {{P(0)}, {N(0), P(1)}};
    Formula copy = f;
    check_sat(f);
    REQUIRE(f == copy);
}

TEST_CASE("Solver statistics", "[solver][stats]") {
    Solver solver;

    SECTION("propagation only") {
        Formula f = {{P(0)}, {N(0), P(1)}};
        auto result = solver.solve(f);
        REQUIRE(result.has_value());
        REQUIRE(solver.stats().decisions == 0);
        REQUIRE(solver.stats().propagations == 2);
        REQUIRE(solver.stats().conflicts == 0);
        REQUIRE(solver.stats().max_depth == 0);
    }

    SECTION("unsatisfiable search counts conflicts") {
        Formula f = {
            {P(0), P(1)}, {N(0), N(1)},
            {P(1), P(2)}, {N(1), N(2)},
            {P(2), P(0)}, {N(2), N(0)},
        };
        REQUIRE_FALSE(solver.solve(f).has_value());
        REQUIRE(solver.stats().decisions == 1);
        REQUIRE(solver.stats().conflicts == 2);
        REQUIRE(solver.stats().max_depth == 1);
    }

    SECTION("stats are reset between runs") {
        Formula hard = {{P(0), P(1)}, {N(0), N(1)}};
        solver.solve(hard);
        REQUIRE(solver.stats().decisions > 0);

        solver.solve(Formula{});
        REQUIRE(solver.stats().decisions == 0);
        REQUIRE(solver.stats().propagations == 0);
    }
}

TEST_CASE("Solver with solution verification", "[solver]") {
    Solver solver;
    solver.set_verify_solution(true);

    Formula f = {{P(0), P(1)}, {N(0)}, {N(1), P(2)}};
    auto result = solver.solve(f);
    REQUIRE(result.has_value());
    REQUIRE(*result == Assignment{false, true, true});
}
