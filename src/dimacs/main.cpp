#include "dpll_sat/dimacs/problem.hpp"
#include "dpll_sat/solver.hpp"
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-s] [-v] [-c] [file.cnf]\n";
    std::cerr << "  -s      Print solver statistics to stderr\n";
    std::cerr << "  -v      Verbose mode (print search progress)\n";
    std::cerr << "  -c      Check the assignment against the input before printing\n";
    std::cerr << "Reads standard input when no file is given.\n";
}

bool g_print_stats = false;
bool g_verbose = false;
bool g_check = false;

void print_stats(const dpll_sat::Solver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "c Stats: decisions=" << s.decisions
              << " propagations=" << s.propagations
              << " conflicts=" << s.conflicts
              << " max_depth=" << s.max_depth
              << "\n";
}

int main(int argc, char* argv[]) {
    const char* filename = nullptr;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-c") == 0) {
            g_check = true;
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::unique_ptr<dpll_sat::dimacs::Problem> problem;
    try {
        problem = filename ? dpll_sat::dimacs::parse_file(filename)
                           : dpll_sat::dimacs::parse_stream(stdin);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    dpll_sat::Solver solver;
    solver.set_verbose(g_verbose);
    solver.set_verify_solution(g_check);

    std::optional<dpll_sat::Assignment> assignment;
    try {
        assignment = solver.solve(problem->formula);
    } catch (const std::logic_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    print_stats(solver);

    if (!assignment) {
        return 1;
    }

    std::cout << dpll_sat::dimacs::format_assignment(*assignment) << "\n";
    return 0;
}
