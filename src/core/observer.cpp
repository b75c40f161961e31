#include "sudoku_csp/observer.hpp"
#include "sudoku_csp/format.hpp"
#include <sstream>

namespace sudoku_csp {

VerboseObserver::VerboseObserver(std::ostream& os, int level)
    : os_(os)
    , level_(level) {}

void VerboseObserver::dump(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        os_ << "% " << line << "\n";
    }
}

void VerboseObserver::on_state_start(const Grid& grid, size_t remaining) {
    ++state_count_;
    if (level_ < SUMMARY) return;
    os_ << "% [verbose] state #" << state_count_ << " (" << remaining << " remain)\n";
    if (level_ >= DEBUG) dump(format_simple_grid(grid));
}

void VerboseObserver::on_state_end(PropagationStatus status, const Grid& grid, size_t remaining) {
    if (level_ < SUMMARY) return;
    os_ << "% [verbose] state #" << state_count_ << " done: " << to_string(status)
        << ", " << grid.total_candidates() << " candidates (" << remaining << " remain)\n";
    if (level_ >= DEBUG) dump(format_simple_grid(grid));
}

void VerboseObserver::on_pass_start(size_t pass, size_t total_candidates) {
    if (level_ < DETAIL) return;
    os_ << "% [verbose] pass #" << pass << " start: " << total_candidates << " candidates\n";
}

void VerboseObserver::on_rule_applied(const Rule& rule, size_t eliminated, const Grid& grid) {
    if (level_ < TRACE && (level_ < DETAIL || eliminated == 0)) return;
    os_ << "% [verbose]   " << rule.name() << ": " << eliminated << " candidate(s) eliminated\n";
    if (level_ >= TRACE && eliminated > 0) dump(format_grid(grid, false));
}

void VerboseObserver::on_pass_end(size_t pass, size_t eliminated,
                                  size_t total_before, size_t total_after, const Grid& grid) {
    if (level_ < DETAIL) return;
    os_ << "% [verbose] pass #" << pass << " done: " << eliminated << " eliminated, in = "
        << total_before << ", out = " << total_after << "\n";
    if (level_ >= DEBUG) dump(format_grid(grid, false));
}

void VerboseObserver::on_branch(size_t cell, int digit, const Grid& child, size_t queue_size) {
    if (level_ < SUMMARY) return;
    os_ << "% [verbose] branch at (" << cell / GRID_SIZE << ", " << cell % GRID_SIZE
        << ") = " << digit << " (queue " << queue_size << ")\n";
    if (level_ >= TRACE) dump(format_simple_grid(child));
}

void VerboseObserver::on_solution(const Grid& grid, size_t count) {
    if (level_ < SUMMARY) return;
    os_ << "% [verbose] solution #" << count << " found\n";
    if (level_ >= DEBUG) dump(format_simple_grid(grid));
}

} // namespace sudoku_csp
