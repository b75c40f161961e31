#include "sudoku_csp/candidates.hpp"

namespace sudoku_csp {

std::vector<Candidates::digit_type> Candidates::values() const {
    std::vector<digit_type> result;
    result.reserve(size());
    for (digit_type d = MIN_DIGIT; d <= MAX_DIGIT; ++d) {
        if (mask_ & bit(d)) {
            result.push_back(d);
        }
    }
    return result;
}

std::string Candidates::to_string() const {
    std::string out = "{";
    bool first = true;
    for (auto d : values()) {
        if (!first) out += ",";
        first = false;
        out += static_cast<char>('0' + d);
    }
    out += "}";
    return out;
}

} // namespace sudoku_csp
