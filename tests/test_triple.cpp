// ==========================
// tests/test_triple.cpp
// ==========================
// Unit tests for the Triple value type and its text parser.
// Uses doctest; this file provides its own main().
// ==========================

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"              // doctest framework header

#include "triple/Triple.hpp"      // Triple class declaration

#include <stdexcept>              // std::out_of_range
#include <string>                 // std::string

// Small helper: parse and require success
static Triple parsed(const std::string& text) {
    auto t = Triple::parse(text);
    REQUIRE(t.has_value());
    return *t;
}

// ---------------------------
// Construction and access
// ---------------------------
TEST_CASE("Triple keeps input order and guards indices") {
    Triple t(5, 3, 4);
    CHECK(t[0] == 5);
    CHECK(t.at(1) == 3);
    CHECK(t.at(2) == 4);
    CHECK_THROWS_AS(t.at(3), std::out_of_range);
    CHECK(t.label() == "(5, 3, 4)");
}

TEST_CASE("Equality is positional, distinct() is a set") {
    CHECK(Triple(3, 4, 5) == Triple(3, 4, 5));
    CHECK(Triple(3, 4, 5) != Triple(4, 3, 5));

    CHECK(Triple(3, 4, 5).distinct().size() == 3);
    CHECK(Triple(0, 0, 0).distinct().size() == 1);
    CHECK(Triple(5, 0, 5).distinct().size() == 2);
}

// ---------------------------
// Accepted formats
// ---------------------------
TEST_CASE("parse accepts the common delimiter styles") {
    const Triple want(3, 4, 5);
    CHECK(parsed("3,4,5") == want);
    CHECK(parsed("(3,4,5)") == want);
    CHECK(parsed("[3, 4, 5]") == want);
    CHECK(parsed("  3 , 4 ,5  ") == want);
    CHECK(parsed("3 4 5") == want);
    CHECK(parsed("(3\t4  5)") == want);
}

TEST_CASE("parse keeps signs and large values") {
    CHECK(parsed("-3,+4,5") == Triple(-3, 4, 5));
    CHECK(parsed("0,0,0") == Triple(0, 0, 0));
    CHECK(parsed("4400000000000001, 117, 125") == Triple(4400000000000001LL, 117, 125));
    CHECK(parsed("9223372036854775807,1,1")[0] == 9223372036854775807LL);
}

// ---------------------------
// Rejected input
// ---------------------------
TEST_CASE("parse rejects malformed input") {
    CHECK_FALSE(Triple::parse("").has_value());
    CHECK_FALSE(Triple::parse("()").has_value());
    CHECK_FALSE(Triple::parse("3,4").has_value());
    CHECK_FALSE(Triple::parse("3 4").has_value());
    CHECK_FALSE(Triple::parse("3,4,5,6").has_value());
    CHECK_FALSE(Triple::parse("a,b,c").has_value());
    CHECK_FALSE(Triple::parse("3,,5").has_value());
    CHECK_FALSE(Triple::parse("3.0,4,5").has_value());
    CHECK_FALSE(Triple::parse("3,4 5,6").has_value());   // comma split wins; "4 5" is not an integer
    CHECK_FALSE(Triple::parse("-,4,5").has_value());
    CHECK_FALSE(Triple::parse("99999999999999999999,1,1").has_value()); // does not fit
}
