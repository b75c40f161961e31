#include "sudoku_csp/solver.hpp"
#include "sudoku_csp/observer.hpp"
#include <algorithm>
#include <utility>

namespace sudoku_csp {

const char* to_string(SolveStatus status) {
    switch (status) {
        case SolveStatus::Unique:
            return "unique";
        case SolveStatus::NoSolution:
            return "no_solution";
        case SolveStatus::MultipleSolutions:
            return "multiple_solutions";
    }
    return "unknown";
}

Solver::Solver() = default;

Solver::Solver(Propagator propagator)
    : propagator_(std::move(propagator)) {}

void Solver::set_observer(SolverObserver* observer) {
    observer_ = observer;
    propagator_.set_observer(observer);
}

SolveResult Solver::solve(const Puzzle& puzzle) {
    SolveResult result;

    // 一意性の判定には 2 つ目の解が必要
    size_t limit = solution_limit_;
    if (limit == 1) limit = 2;

    solve_all(puzzle, [&result, limit](const Puzzle& sol) {
        result.solutions.push_back(sol);
        return limit == 0 || result.solutions.size() < limit;
    });

    if (result.solutions.empty()) {
        result.status = SolveStatus::NoSolution;
    } else if (result.solutions.size() == 1) {
        result.status = SolveStatus::Unique;
        result.solution = result.solutions.front();
    } else {
        result.status = SolveStatus::MultipleSolutions;
    }
    return result;
}

SolveResult Solver::solve(const PuzzleRows& rows) {
    return solve(validate_puzzle(rows));
}

size_t Solver::solve_all(const Puzzle& puzzle, SolutionCallback callback) {
    stats_ = SolverStats{};
    propagator_.reset_stats();

    std::deque<Grid> queue;
    queue.emplace_back(puzzle);
    stats_.max_queue_size = 1;

    while (!queue.empty()) {
        Grid grid = pop(queue);
        ++stats_.states;
        if (observer_) observer_->on_state_start(grid, queue.size());

        PropagationStatus status = propagator_.propagate(grid);
        if (observer_) observer_->on_state_end(status, grid, queue.size());

        if (status == PropagationStatus::Contradiction) {
            ++stats_.contradictions;
        } else if (status == PropagationStatus::Solved) {
            ++stats_.solutions;
            if (observer_) observer_->on_solution(grid, stats_.solutions);
            if (!callback(grid.to_puzzle())) {
                break;
            }
        } else {
            branch(grid, queue);
        }
    }

    stats_.propagation = propagator_.stats();
    return stats_.solutions;
}

void Solver::branch(const Grid& grid, std::deque<Grid>& queue) {
    size_t target = grid.first_undetermined().value();
    std::vector<int> digits = grid.cell(target).values();

    // 深さ優先では末尾から取り出すので、小さい数字が先に出るよう逆順に積む
    if (order_ == SearchOrder::DepthFirst) {
        std::reverse(digits.begin(), digits.end());
    }

    for (int d : digits) {
        queue.push_back(grid);
        queue.back().cell(target).assign(d);
        ++stats_.branches;
        if (observer_) observer_->on_branch(target, d, queue.back(), queue.size());
    }

    stats_.max_queue_size = std::max(stats_.max_queue_size, queue.size());
}

Grid Solver::pop(std::deque<Grid>& queue) const {
    if (order_ == SearchOrder::DepthFirst) {
        Grid grid = std::move(queue.back());
        queue.pop_back();
        return grid;
    }
    Grid grid = std::move(queue.front());
    queue.pop_front();
    return grid;
}

SolveResult solve(const Puzzle& puzzle) {
    Solver solver;
    return solver.solve(puzzle);
}

} // namespace sudoku_csp
