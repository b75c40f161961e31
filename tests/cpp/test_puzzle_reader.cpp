#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "puzzle_reader.hpp"
#include "sudoku_csp/solver.hpp"
#include "sudoku_csp/format.hpp"
#include "puzzles.hpp"
#include <climits>
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace sudoku_csp;
using Catch::Matchers::ContainsSubstring;

namespace {

const char* CLASSIC_LIST =
    "puzzle = [\n"
    "    [0, 0, 6, 1, 0, 0, 0, 0, 8],\n"
    "    [0, 8, 0, 0, 9, 0, 0, 3, 0],\n"
    "    [2, 0, 0, 0, 0, 5, 4, 0, 0],\n"
    "    [4, 0, 0, 0, 0, 1, 8, 0, 0],\n"
    "    [0, 3, 0, 0, 7, 0, 0, 4, 0],\n"
    "    [0, 0, 7, 9, 0, 0, 0, 0, 3],\n"
    "    [0, 0, 8, 4, 0, 0, 0, 0, 6],\n"
    "    [0, 2, 0, 0, 5, 0, 0, 8, 0],\n"
    "    [1, 0, 0, 0, 0, 2, 5, 0, 0]\n"
    "]\n";

const char* CLASSIC_PLAIN =
    "# classic\n"
    "..6|1..|..8\n"
    ".8.|.9.|.3.\n"
    "2..|..5|4..\n"
    "---+---+---\n"
    "4..|..1|8..\n"
    ".3.|.7.|.4.\n"
    "..7|9..|..3\n"
    "---+---+---\n"
    "..8|4..|..6\n"
    ".2.|.5.|.8.\n"
    "1..|..2|5..\n";

}  // namespace

// ============================================================================
// List form
// ============================================================================

TEST_CASE("Reader list form", "[reader]") {
    auto expected = test_puzzles::from_line(test_puzzles::CLASSIC);

    SECTION("named assignment") {
        auto rows = io::parse_string(CLASSIC_LIST);
        REQUIRE(rows.size() == 9);
        REQUIRE(validate_puzzle(rows) == expected);
    }

    SECTION("bare list with trailing commas and semicolon") {
        std::string input = "[";
        for (const auto& row : to_rows(expected)) {
            input += "[";
            for (int v : row) {
                input += std::to_string(v) + ",";
            }
            input += "],\n";
        }
        input += "];";
        REQUIRE(validate_puzzle(io::parse_string(input)) == expected);
    }

    SECTION("comments inside the list") {
        std::string input = "# header\n" + std::string(CLASSIC_LIST) + "# trailer\n";
        REQUIRE(validate_puzzle(io::parse_string(input)) == expected);
    }

    SECTION("ragged rows are kept for validation") {
        auto rows = io::parse_string("[[1, 2, 3], [], [4]]");
        REQUIRE(rows.size() == 3);
        REQUIRE(rows[0] == std::vector<int>{1, 2, 3});
        REQUIRE(rows[1].empty());
        REQUIRE_THROWS_AS(validate_puzzle(rows), MalformedInput);
    }

    SECTION("out-of-range values are kept for validation") {
        auto rows = io::parse_string("[[-3, 12, 99999999999999999999]]");
        REQUIRE(rows[0][0] == -3);
        REQUIRE(rows[0][1] == 12);
        REQUIRE(rows[0][2] == INT_MAX);
        REQUIRE_THROWS_AS(validate_puzzle(rows), MalformedInput);
    }
}

// ============================================================================
// Plain form
// ============================================================================

TEST_CASE("Reader plain form", "[reader]") {
    auto expected = test_puzzles::from_line(test_puzzles::CLASSIC);

    SECTION("dots and separators") {
        REQUIRE(validate_puzzle(io::parse_string(CLASSIC_PLAIN)) == expected);
    }

    SECTION("single line of digits") {
        REQUIRE(validate_puzzle(io::parse_string(test_puzzles::CLASSIC)) == expected);
    }

    SECTION("missing cells fail validation") {
        auto rows = io::parse_string(test_puzzles::CLASSIC.substr(0, 80));
        REQUIRE(rows.size() == 9);
        REQUIRE(rows.back().size() == 8);
        REQUIRE_THROWS_AS(validate_puzzle(rows), MalformedInput);
    }

    SECTION("extra cells fail validation") {
        auto rows = io::parse_string(test_puzzles::CLASSIC + "1");
        REQUIRE(rows.size() == 10);
        REQUIRE_THROWS_AS(validate_puzzle(rows), MalformedInput);
    }
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Reader syntax errors", "[reader]") {
    SECTION("unexpected character") {
        REQUIRE_THROWS_WITH(io::parse_string("12?45"), ContainsSubstring("Parse error"));
    }

    SECTION("unterminated list") {
        REQUIRE_THROWS_WITH(io::parse_string("[[1, 2, 3]"), ContainsSubstring("Parse error"));
    }

    SECTION("empty input") {
        REQUIRE_THROWS_WITH(io::parse_string(""), ContainsSubstring("Parse error"));
    }

    SECTION("error message carries the line number") {
        REQUIRE_THROWS_WITH(io::parse_string("123\n456\n7x9"), ContainsSubstring("line 3"));
    }
}

// ============================================================================
// Files
// ============================================================================

TEST_CASE("Reader parse_file", "[reader]") {
    SECTION("missing file") {
        REQUIRE_THROWS_WITH(io::parse_file("/nonexistent/sudoku_csp/puzzle.txt"),
                            ContainsSubstring("Cannot open file"));
    }

    SECTION("read and solve") {
        auto path = std::filesystem::temp_directory_path() / "sudoku_csp_reader_test.txt";
        {
            std::ofstream out(path);
            out << CLASSIC_PLAIN;
        }

        auto puzzle = validate_puzzle(io::parse_file(path.string()));
        std::remove(path.string().c_str());

        auto result = solve(puzzle);
        REQUIRE(result.status == SolveStatus::Unique);
        REQUIRE(to_line(*result.solution) == test_puzzles::SOLVED);
    }
}
