#include "dpll_sat/branching.hpp"
#include <vector>

namespace dpll_sat {

size_t dominant_variable(const Formula& formula, size_t n_vars) {
    std::vector<size_t> freqs(n_vars, 0);
    for (const auto& clause : formula) {
        for (const auto& lit : clause) {
            freqs[lit.var_idx]++;
        }
    }

    size_t max_freq = 0;
    size_t argmax = 0;
    for (size_t i = 0; i < freqs.size(); ++i) {
        if (freqs[i] > max_freq) {
            max_freq = freqs[i];
            argmax = i;
        }
    }
    return argmax;
}

} // namespace dpll_sat
