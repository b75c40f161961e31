#include <catch2/catch_test_macros.hpp>
#include "sudoku_csp/candidates.hpp"

using namespace sudoku_csp;

// ============================================================================
// Candidates tests
// ============================================================================

TEST_CASE("Candidates basic operations", "[candidates]") {
    Candidates c = Candidates::full();

    SECTION("initial state") {
        REQUIRE(c.size() == 9);
        REQUIRE(!c.empty());
        REQUIRE(!c.is_singleton());
        REQUIRE(c.min() == 1);
        REQUIRE_FALSE(c.value().has_value());
    }

    SECTION("contains") {
        REQUIRE(c.contains(1));
        REQUIRE(c.contains(9));
        REQUIRE(!c.contains(0));
        REQUIRE(!c.contains(10));
    }

    SECTION("values are sorted") {
        auto vals = c.values();
        REQUIRE(vals.size() == 9);
        REQUIRE(vals.front() == 1);
        REQUIRE(vals.back() == 9);
    }

    SECTION("default is empty") {
        Candidates e;
        REQUIRE(e.empty());
        REQUIRE(e.size() == 0);
        REQUIRE(e.to_string() == "{}");
    }
}

TEST_CASE("Candidates remove", "[candidates]") {
    Candidates c = Candidates::full();

    SECTION("remove present digit") {
        REQUIRE(c.remove(3));
        REQUIRE(c.size() == 8);
        REQUIRE(!c.contains(3));
    }

    SECTION("remove absent digit") {
        REQUIRE(c.remove(3));
        REQUIRE_FALSE(c.remove(3));
        REQUIRE(c.size() == 8);
    }

    SECTION("remove_all counts removed digits") {
        Candidates other(Candidates::bit(1) | Candidates::bit(2) | Candidates::bit(3));
        c.remove(2);
        REQUIRE(c.remove_all(other) == 2);
        REQUIRE(c.size() == 6);
        REQUIRE(c.min() == 4);
    }

    SECTION("remove down to empty") {
        Candidates s = Candidates::single(4);
        REQUIRE(s.remove(4));
        REQUIRE(s.empty());
        REQUIRE_FALSE(s.is_singleton());
    }
}

TEST_CASE("Candidates intersect and assign", "[candidates]") {
    Candidates c = Candidates::full();

    SECTION("assign present digit") {
        REQUIRE(c.assign(7) == 8);
        REQUIRE(c.is_singleton());
        REQUIRE(c.value().value() == 7);
    }

    SECTION("assign absent digit empties the set") {
        c.remove(7);
        c.assign(7);
        REQUIRE(c.empty());
    }

    SECTION("intersect") {
        Candidates pair(Candidates::bit(2) | Candidates::bit(8));
        REQUIRE(c.intersect(pair) == 7);
        REQUIRE(c == pair);
        REQUIRE(c.to_string() == "{2,8}");
    }
}

TEST_CASE("Candidates set relations", "[candidates]") {
    Candidates a(Candidates::bit(1) | Candidates::bit(2));
    Candidates b(Candidates::bit(1) | Candidates::bit(2) | Candidates::bit(5));
    Candidates d(Candidates::bit(7));

    REQUIRE(a.is_subset_of(b));
    REQUIRE(b.is_superset_of(a));
    REQUIRE(!b.is_subset_of(a));
    REQUIRE(a.is_subset_of(a));
    REQUIRE(Candidates().is_subset_of(a));
    REQUIRE(a.intersects(b));
    REQUIRE(!a.intersects(d));
    REQUIRE((a | d).size() == 3);
    REQUIRE((a & b) == a);
}

TEST_CASE("Candidates mask ignores out-of-range bits", "[candidates]") {
    Candidates c(0xFFFF);
    REQUIRE(c.size() == 9);
    REQUIRE(c == Candidates::full());
}

TEST_CASE("Candidates out-of-range digits", "[candidates]") {
    REQUIRE(Candidates::bit(0) == 0);
    REQUIRE(Candidates::bit(-1) == 0);
    REQUIRE(Candidates::bit(10) == 0);
    REQUIRE(Candidates::bit(-40) == 0);
    REQUIRE(Candidates::single(-3).empty());
    REQUIRE(Candidates::single(12).empty());

    Candidates c = Candidates::full();
    REQUIRE_FALSE(c.remove(-1));
    REQUIRE(c.assign(0) == 9);
    REQUIRE(c.empty());
}
