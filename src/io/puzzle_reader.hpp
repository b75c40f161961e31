/**
 * @file puzzle_reader.hpp
 * @brief パズルファイルパーサーのインターフェース
 */
#ifndef SUDOKU_CSP_IO_PUZZLE_READER_HPP
#define SUDOKU_CSP_IO_PUZZLE_READER_HPP

#include "sudoku_csp/puzzle.hpp"
#include <cstdio>
#include <string>

// Forward declarations for flex/bison
typedef void* yyscan_t;
struct ParserContext;

// Flex functions
int yylex_init(yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
void yyset_in(FILE* in, yyscan_t scanner);
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);

// Bison function
int yyparse(yyscan_t scanner, ParserContext* ctx);

namespace sudoku_csp {
namespace io {

/**
 * @brief ファイルからパズルを読み込む
 *
 * 形状・値の検証は行わない（validate_puzzle() を使う）。
 * 平文形式のセルは 9 個ずつ行に分割する。
 *
 * @throws std::runtime_error ファイルが開けない、または構文エラー
 */
PuzzleRows parse_file(const std::string& filename);

/**
 * @brief 文字列からパズルを読み込む
 * @throws std::runtime_error 構文エラー
 */
PuzzleRows parse_string(const std::string& input);

} // namespace io
} // namespace sudoku_csp

#endif // SUDOKU_CSP_IO_PUZZLE_READER_HPP
