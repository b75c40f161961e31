#include "sudoku_csp/solver.hpp"
#include "sudoku_csp/observer.hpp"
#include "sudoku_csp/format.hpp"
#include "puzzle_reader.hpp"
#include "cli_options.hpp"
#include <iostream>
#include <string>
#include <memory>

namespace {

constexpr int EXIT_UNIQUE = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_UNSATISFIABLE = 2;
constexpr int EXIT_MULTIPLE = 3;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-a] [-s] [-v LEVEL] [-b] [-n LIMIT] <puzzle-file>\n";
    std::cerr << "  -a        Print every solution found (up to LIMIT)\n";
    std::cerr << "  -s        Print solver statistics to stderr\n";
    std::cerr << "  -v LEVEL  Verbose trace to stderr (1=summary, 2=detail, 3=debug, 4=trace)\n";
    std::cerr << "  -b        Breadth-first search order (default: depth-first)\n";
    std::cerr << "  -n LIMIT  Stop after LIMIT solutions (0 = unlimited, default 2)\n";
}

void print_stats(const sudoku_csp::Solver& solver) {
    const auto& s = solver.stats();
    std::cerr << "% Stats: states=" << s.states
              << " branches=" << s.branches
              << " contradictions=" << s.contradictions
              << " solutions=" << s.solutions
              << " max_queue=" << s.max_queue_size
              << " passes=" << s.propagation.passes
              << "\n";
    for (const auto& r : s.propagation.rules) {
        std::cerr << "%   " << r.name << ": calls=" << r.invocations
                  << " eliminated=" << r.eliminations << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    sudoku_csp::io::CliOptions opts;
    try {
        opts = sudoku_csp::io::parse_options(argc, argv);
    } catch (const sudoku_csp::io::UsageError& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return EXIT_ERROR;
    }

    if (opts.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    sudoku_csp::Solver solver;
    solver.set_search_order(opts.order);
    solver.set_solution_limit(opts.solution_limit);

    std::unique_ptr<sudoku_csp::VerboseObserver> observer;
    if (opts.verbose_level > 0) {
        observer = std::make_unique<sudoku_csp::VerboseObserver>(std::cerr, opts.verbose_level);
        solver.set_observer(observer.get());
    }

    try {
        auto puzzle = sudoku_csp::validate_puzzle(sudoku_csp::io::parse_file(opts.filename));
        if (opts.verbose_level > 0) {
            std::cerr << "% [verbose] " << sudoku_csp::count_givens(puzzle) << " givens\n";
        }

        auto result = solver.solve(puzzle);
        if (opts.print_stats) print_stats(solver);

        switch (result.status) {
            case sudoku_csp::SolveStatus::Unique:
                std::cout << sudoku_csp::format_puzzle(*result.solution);
                std::cout << "==========\n";
                return EXIT_UNIQUE;
            case sudoku_csp::SolveStatus::NoSolution:
                std::cout << "=====UNSATISFIABLE=====\n";
                return EXIT_UNSATISFIABLE;
            case sudoku_csp::SolveStatus::MultipleSolutions:
                if (opts.print_all) {
                    for (const auto& sol : result.solutions) {
                        std::cout << sudoku_csp::format_puzzle(sol);
                        std::cout << "----------\n";
                    }
                }
                std::cout << "=====MULTIPLE SOLUTIONS=====\n";
                return EXIT_MULTIPLE;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_ERROR;
    }

    return EXIT_ERROR;
}
