#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "cli_options.hpp"
#include "sudoku_csp/observer.hpp"
#include <vector>

using namespace sudoku_csp;
using Catch::Matchers::Equals;

namespace {

io::CliOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "sudoku_csp");
    return io::parse_options(static_cast<int>(args.size()), args.data());
}

}  // namespace

// ============================================================================
// Option parsing tests
// ============================================================================

TEST_CASE("parse_options defaults", "[cli]") {
    auto opts = parse({"puzzle.txt"});
    REQUIRE(opts.filename == "puzzle.txt");
    REQUIRE_FALSE(opts.print_all);
    REQUIRE_FALSE(opts.print_stats);
    REQUIRE_FALSE(opts.show_help);
    REQUIRE(opts.verbose_level == 0);
    REQUIRE(opts.order == SearchOrder::DepthFirst);
    REQUIRE(opts.solution_limit == Solver::DEFAULT_SOLUTION_LIMIT);
}

TEST_CASE("parse_options flags", "[cli]") {
    SECTION("all flags") {
        auto opts = parse({"-a", "-s", "-b", "-n", "0", "-v", "3", "puzzle.txt"});
        REQUIRE(opts.print_all);
        REQUIRE(opts.print_stats);
        REQUIRE(opts.order == SearchOrder::BreadthFirst);
        REQUIRE(opts.solution_limit == 0);
        REQUIRE(opts.verbose_level == 3);
        REQUIRE(opts.filename == "puzzle.txt");
    }

    SECTION("-v without a level") {
        auto opts = parse({"-v", "puzzle.txt"});
        REQUIRE(opts.verbose_level == VerboseObserver::SUMMARY);
        REQUIRE(opts.filename == "puzzle.txt");
    }

    SECTION("help stops parsing") {
        auto opts = parse({"--help", "-unknown"});
        REQUIRE(opts.show_help);
    }
}

TEST_CASE("parse_options errors", "[cli]") {
    SECTION("-n as the last argument") {
        REQUIRE_THROWS_WITH(parse({"puzzle.txt", "-n"}), Equals("Missing value for -n"));
    }

    SECTION("invalid limit") {
        REQUIRE_THROWS_WITH(parse({"-n", "-3", "puzzle.txt"}),
                            Equals("Invalid solution limit: -3"));
        REQUIRE_THROWS_AS(parse({"-n", "two", "puzzle.txt"}), io::UsageError);
    }

    SECTION("unknown option") {
        REQUIRE_THROWS_WITH(parse({"-x", "puzzle.txt"}), Equals("Unknown option: -x"));
    }

    SECTION("no file") {
        REQUIRE_THROWS_AS(parse({"-a"}), io::UsageError);
    }
}
