#include "util/readlines.hpp"

#include <doctest.h>

using namespace phabstack;

TEST_CASE("split_lines") {
    SUBCASE("just_text") {
        std::string s = "öl\nbål\nskur";
        auto lines = split_lines(s);

        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0].line == "öl\n");
        REQUIRE(lines[1].line == "bål\n");
        REQUIRE(lines[2].line == "skur");
        CHECK(lines[0].has_newline());
        CHECK(!lines[2].has_newline());
        CHECK(lines[2].line_number == 3);
    }

    SUBCASE("trailing_newline") {
        auto lines = split_lines("a\nb\n");
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[1].line == "b\n");
    }

    SUBCASE("empty") {
        REQUIRE(split_lines("").empty());
    }

    SUBCASE("blank_lines") {
        auto lines = split_lines("\n\n");
        REQUIRE(lines.size() == 2);
        CHECK(lines[0].line == "\n");
        CHECK(lines[0] == lines[1]);
    }

    SUBCASE("newline_matters_for_equality") {
        auto a = split_lines("x");
        auto b = split_lines("x\n");
        CHECK(!(a[0] == b[0]));
    }
}
