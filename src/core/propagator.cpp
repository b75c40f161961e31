#include "sudoku_csp/propagator.hpp"
#include "sudoku_csp/observer.hpp"
#include <utility>

namespace sudoku_csp {

const char* to_string(PropagationStatus status) {
    switch (status) {
        case PropagationStatus::InProgress:
            return "in_progress";
        case PropagationStatus::Solved:
            return "solved";
        case PropagationStatus::Contradiction:
            return "contradiction";
    }
    return "unknown";
}

Propagator::Propagator()
    : Propagator(default_rules(), DEFAULT_EAGER_COUNT) {}

Propagator::Propagator(std::vector<RulePtr> rules, size_t eager_count)
    : rules_(std::move(rules))
    , eager_count_(eager_count) {
    reset_stats();
}

void Propagator::reset_stats() {
    stats_ = PropagationStats{};
    for (const auto& rule : rules_) {
        stats_.rules.push_back(RuleStats{rule->name(), 0, 0});
    }
}

PropagationStatus Propagator::propagate(Grid& grid) {
    ++stats_.runs;
    size_t total = grid.total_candidates();
    size_t pass = 0;

    while (true) {
        ++pass;
        ++stats_.passes;
        if (observer_) observer_->on_pass_start(pass, total);

        size_t eliminated = 0;
        for (size_t i = 0; i < rules_.size(); ++i) {
            // 安いルールが進展したパスでは高価なルールを実行しない
            if (i >= eager_count_ && eliminated > 0) break;

            size_t n = rules_[i]->apply(grid);
            eliminated += n;
            ++stats_.rules[i].invocations;
            stats_.rules[i].eliminations += n;
            if (observer_) observer_->on_rule_applied(*rules_[i], n, grid);
        }

        size_t new_total = grid.total_candidates();
        if (observer_) observer_->on_pass_end(pass, eliminated, total, new_total, grid);
        total = new_total;

        if (eliminated == 0 || grid.has_empty_cell()) break;
    }

    return classify(grid);
}

PropagationStatus Propagator::classify(const Grid& grid) {
    if (grid.has_empty_cell()) {
        return PropagationStatus::Contradiction;
    }
    if (grid.total_candidates() == CELL_COUNT) {
        return PropagationStatus::Solved;
    }
    return PropagationStatus::InProgress;
}

} // namespace sudoku_csp
