#include "output/unified.hpp"

#include "algorithms/myers_greedy.hpp"

#include <doctest.h>

using namespace phabstack;

TEST_CASE("hunk_header") {
    SUBCASE("format") {
        DiffHunk hunk{1, 2, 1, 3, {}};
        CHECK(format_hunk_header(hunk) == "@@ -1,2 +1,3 @@\n");

        DiffHunk single{4, 1, 0, 0, {}};
        CHECK(format_hunk_header(single) == "@@ -4 +0,0 @@\n");
    }

    SUBCASE("parse_with_lengths") {
        HunkHeader header;
        REQUIRE(parse_hunk_header("@@ -3,7 +4,9 @@\n", header));
        CHECK(header.old_offset == 3);
        CHECK(header.old_length == 7);
        CHECK(header.new_offset == 4);
        CHECK(header.new_length == 9);
    }

    SUBCASE("omitted_length_is_one") {
        HunkHeader header;
        REQUIRE(parse_hunk_header("@@ -1 +1,2 @@", header));
        CHECK(header.old_length == 1);
        CHECK(header.new_length == 2);

        REQUIRE(parse_hunk_header("@@ -0,0 +1 @@ trailing section", header));
        CHECK(header.old_offset == 0);
        CHECK(header.old_length == 0);
        CHECK(header.new_length == 1);
    }

    SUBCASE("rejects_garbage") {
        HunkHeader header;
        CHECK(!parse_hunk_header("@@ -a +b @@", header));
        CHECK(!parse_hunk_header(" a\n", header));
    }
}

TEST_CASE("unified_diff_render") {
    auto a = split_lines("a\nb\n");
    auto b = split_lines("a\nc");
    DiffInput<Line> input{gsl::span<Line>{a}, gsl::span<Line>{b}, "a/f", "b/f"};
    auto result = MyersGreedy<Line>(input).compute();
    auto hunks = compose_hunks(result.edit_sequence, 3);
    auto lines = unified_diff_render(input, hunks);

    REQUIRE(lines.size() == 6);
    CHECK(lines[0] == "--- a/f\n");
    CHECK(lines[1] == "+++ b/f\n");
    CHECK(lines[2] == "@@ -1,2 +1,2 @@\n");
    CHECK(lines[3] == " a\n");
    CHECK(lines[4] == "-b\n");
    CHECK(lines[5] == "+c");
}
