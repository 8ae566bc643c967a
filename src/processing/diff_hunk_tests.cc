#include "processing/diff_hunk.hpp"

#include <doctest.h>

using namespace phabstack;

namespace {

// Build an edit sequence from a pattern of ' ', '-' and '+'.
std::vector<Edit>
edits(const std::string& pattern) {
    std::vector<Edit> sequence;
    int64_t a = 0, b = 0;
    for (char c : pattern) {
        if (c == ' ') {
            sequence.push_back({EditType::Common, EditIndex(a++), EditIndex(b++)});
        } else if (c == '-') {
            sequence.push_back({EditType::Delete, EditIndex(a++), EditIndexInvalid});
        } else {
            sequence.push_back({EditType::Insert, EditIndexInvalid, EditIndex(b++)});
        }
    }
    return sequence;
}

}  // namespace

TEST_CASE("compose_hunks") {
    SUBCASE("context_is_trimmed") {
        auto hunks = compose_hunks(edits("      -+      "), 3);
        REQUIRE(hunks.size() == 1);
        CHECK(hunks[0].from_start == 4);
        CHECK(hunks[0].from_count == 7);
        CHECK(hunks[0].to_start == 4);
        CHECK(hunks[0].to_count == 7);
        CHECK(hunks[0].edit_units.size() == 8);
    }

    SUBCASE("distant_changes_split") {
        auto hunks = compose_hunks(edits("-          +"), 2);
        REQUIRE(hunks.size() == 2);
        CHECK(hunks[0].from_start == 1);
        CHECK(hunks[0].from_count == 3);
        CHECK(hunks[0].to_start == 1);
        CHECK(hunks[0].to_count == 2);
        CHECK(hunks[1].from_start == 10);
        CHECK(hunks[1].from_count == 2);
        CHECK(hunks[1].to_start == 9);
        CHECK(hunks[1].to_count == 3);
    }

    SUBCASE("close_changes_join") {
        auto hunks = compose_hunks(edits("- -"), 1);
        REQUIRE(hunks.size() == 1);
        CHECK(hunks[0].from_count == 3);
        CHECK(hunks[0].to_count == 1);
    }

    SUBCASE("full_context_spans_everything") {
        auto sequence = edits(" + - ++  -");
        auto hunks = compose_hunks(sequence, static_cast<int64_t>(sequence.size()));
        REQUIRE(hunks.size() == 1);
        CHECK(hunks[0].from_start == 1);
        CHECK(hunks[0].from_count == 7);
        CHECK(hunks[0].to_start == 1);
        CHECK(hunks[0].to_count == 8);
        CHECK(hunks[0].edit_units.size() == sequence.size());
    }

    SUBCASE("pure_insertion_starts_at_preceding_line") {
        auto hunks = compose_hunks(edits("  ++"), 0);
        REQUIRE(hunks.size() == 1);
        CHECK(hunks[0].from_start == 2);
        CHECK(hunks[0].from_count == 0);
        CHECK(hunks[0].to_start == 3);
        CHECK(hunks[0].to_count == 2);
    }

    SUBCASE("only_common") {
        CHECK(compose_hunks(edits("   "), 3).empty());
    }
}
