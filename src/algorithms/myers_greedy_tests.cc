#include "algorithms/myers_greedy.hpp"
#include "util/readlines.hpp"

#include <doctest.h>

using namespace phabstack;

namespace {

std::string
edit_string(const std::vector<Edit>& edits) {
    std::string s;
    for (const auto& e : edits) {
        switch (e.type) {
            case EditType::Delete:
                s += '-';
                break;
            case EditType::Insert:
                s += '+';
                break;
            case EditType::Common:
                s += ' ';
                break;
        }
    }
    return s;
}

DiffResult
diff_bodies(const std::string& a, const std::string& b) {
    auto a_lines = split_lines(a);
    auto b_lines = split_lines(b);
    DiffInput<Line> input{gsl::span<Line>{a_lines}, gsl::span<Line>{b_lines}, "a", "b"};
    return MyersGreedy<Line>(input).compute();
}

}  // namespace

TEST_CASE("myers_greedy") {
    SUBCASE("deletions_before_insertions") {
        auto result = diff_bodies("a\nb\n", "a\nc\n");
        REQUIRE(result.status == DiffResultStatus::OK);
        CHECK(edit_string(result.edit_sequence) == " -+");
    }

    SUBCASE("no_changes_is_all_common") {
        auto result = diff_bodies("a\nb\n", "a\nb\n");
        REQUIRE(result.status == DiffResultStatus::NoChanges);
        CHECK(edit_string(result.edit_sequence) == "  ");
    }

    SUBCASE("empty_sides") {
        CHECK(edit_string(diff_bodies("", "x\ny\n").edit_sequence) == "++");
        CHECK(edit_string(diff_bodies("x\n", "").edit_sequence) == "-");
        CHECK(diff_bodies("", "").status == DiffResultStatus::NoChanges);
    }

    SUBCASE("minimal_edit_script") {
        auto result = diff_bodies("a\nb\nc\na\nb\nb\na\n", "c\nb\na\nb\na\nc\n");
        REQUIRE(result.status == DiffResultStatus::OK);
        int changes = 0;
        for (const auto& e : result.edit_sequence) {
            if (e.type != EditType::Common) {
                changes++;
            }
        }
        CHECK(changes == 5);
    }

    SUBCASE("indices_cover_both_sides") {
        auto result = diff_bodies("1\n2\n3\n4\n", "0\n2\n4\n5\n");
        int64_t a_next = 0, b_next = 0;
        for (const auto& e : result.edit_sequence) {
            if (e.type != EditType::Insert) {
                CHECK(e.a_index.value == a_next);
                a_next++;
            }
            if (e.type != EditType::Delete) {
                CHECK(e.b_index.value == b_next);
                b_next++;
            }
        }
        CHECK(a_next == 4);
        CHECK(b_next == 4);
    }
}
