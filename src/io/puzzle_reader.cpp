#include "puzzle_reader.hpp"
#include "parser.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sudoku_csp {
namespace io {

namespace {

/**
 * @brief 再入可能スキャナの所有者
 */
class Scanner {
public:
    Scanner() { yylex_init(&scanner_); }
    ~Scanner() { yylex_destroy(scanner_); }

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    yyscan_t get() const { return scanner_; }

private:
    yyscan_t scanner_ = nullptr;
};

PuzzleRows collect_rows(ParserContext& ctx) {
    if (!ctx.plain) {
        return std::move(ctx.rows);
    }

    // 平文形式は 9 セルずつ行にする（端数は最後の行）
    PuzzleRows rows;
    for (size_t i = 0; i < ctx.cells.size(); i += GRID_SIZE) {
        size_t end = std::min(i + GRID_SIZE, ctx.cells.size());
        rows.emplace_back(ctx.cells.begin() + i, ctx.cells.begin() + end);
    }
    return rows;
}

PuzzleRows run_parser(const Scanner& scanner) {
    ParserContext ctx;
    int result = yyparse(scanner.get(), &ctx);
    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }
    return collect_rows(ctx);
}

}  // namespace

PuzzleRows parse_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    PuzzleRows rows;
    try {
        Scanner scanner;
        yyset_in(file, scanner.get());
        rows = run_parser(scanner);
    } catch (...) {
        fclose(file);
        throw;
    }
    fclose(file);
    return rows;
}

PuzzleRows parse_string(const std::string& input) {
    Scanner scanner;
    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner.get());

    PuzzleRows rows;
    try {
        rows = run_parser(scanner);
    } catch (...) {
        yy_delete_buffer(buffer, scanner.get());
        throw;
    }
    yy_delete_buffer(buffer, scanner.get());
    return rows;
}

} // namespace io
} // namespace sudoku_csp
