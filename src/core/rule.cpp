#include "sudoku_csp/rule.hpp"

namespace sudoku_csp {

std::vector<RulePtr> default_rules() {
    return {
        std::make_shared<EliminateFoundRule>(),
        std::make_shared<UniqueCellRule>(),
        std::make_shared<NakedTupleRule>(),
        std::make_shared<HiddenTupleRule>(),
        std::make_shared<LockedCandidatesRule>(),
        std::make_shared<XWingRule>(),
        std::make_shared<SwordfishRule>(),
    };
}

} // namespace sudoku_csp
