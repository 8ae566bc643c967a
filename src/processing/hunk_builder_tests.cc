#include "processing/hunk_builder.hpp"

#include "util/readlines.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace phabstack;

namespace {

const std::string marker = "\\ No newline at end of file\n";

struct Sides {
    std::string old_body;
    std::string new_body;
};

// Undo a corpus: drop marker lines, strip the prefixes, and drop the newline
// that was added in front of a marker.
Sides
reconstruct(const std::string& corpus) {
    Sides sides;
    auto lines = split_lines(corpus);
    for (size_t i = 0; i < lines.size(); i++) {
        const std::string& line = lines[i].line;
        if (line == marker) {
            continue;
        }
        std::string text = line.substr(1);
        if (i + 1 < lines.size() && lines[i + 1].line == marker) {
            text.pop_back();
        }
        if (line[0] != '+') {
            sides.old_body += text;
        }
        if (line[0] != '-') {
            sides.new_body += text;
        }
    }
    return sides;
}

int
count_markers(const std::string& corpus) {
    int count = 0;
    for (const auto& line : split_lines(corpus)) {
        if (line.line == marker) {
            count++;
        }
    }
    return count;
}

ChangeRecord
record(const std::string& path) {
    ChangeRecord change;
    change.current_path = path;
    change.old_path = path;
    change.kind = ChangeKind::Change;
    return change;
}

}  // namespace

TEST_CASE("hunk_builder") {
    SUBCASE("single_line_change") {
        auto change = record("file.txt");
        Status status;
        REQUIRE(build_hunks(change, "a\nb\n", "a\nc\n", false, status));

        REQUIRE(change.hunks.size() == 1);
        const Hunk& hunk = change.hunks[0];
        CHECK(hunk.old_offset == 1);
        CHECK(hunk.old_length == 2);
        CHECK(hunk.new_offset == 1);
        CHECK(hunk.new_length == 2);
        CHECK(hunk.added == 1);
        CHECK(hunk.deleted == 1);
        CHECK(hunk.corpus == " a\n-b\n+c\n");
        CHECK(hunk.old_eof_newline);
        CHECK(hunk.new_eof_newline);
        CHECK(change.file_type == FileType::Text);
        CHECK(change.binary == false);
    }

    SUBCASE("missing_newlines_on_both_sides") {
        auto change = record("file.txt");
        Status status;
        REQUIRE(build_hunks(change, "x", "x\ny", false, status));

        REQUIRE(change.hunks.size() == 1);
        const Hunk& hunk = change.hunks[0];
        CHECK(count_markers(hunk.corpus) == 2);
        CHECK(!hunk.old_eof_newline);
        CHECK(!hunk.new_eof_newline);
        CHECK(hunk.corpus == "-x\n" + marker + "+x\n+y\n" + marker);
        CHECK(hunk.old_length == 1);
        CHECK(hunk.new_length == 2);
    }

    SUBCASE("context_line_without_newline_clears_both_flags") {
        auto change = record("file.txt");
        Status status;
        REQUIRE(build_hunks(change, "a\nend", "b\nend", false, status));

        const Hunk& hunk = change.hunks[0];
        CHECK(hunk.corpus == "-a\n+b\n end\n" + marker);
        CHECK(!hunk.old_eof_newline);
        CHECK(!hunk.new_eof_newline);
    }

    SUBCASE("added_file") {
        ChangeRecord change;
        change.current_path = "new.txt";
        change.kind = ChangeKind::Add;
        Status status;
        REQUIRE(build_hunks(change, "", "one\ntwo\n", false, status));

        const Hunk& hunk = change.hunks[0];
        CHECK(hunk.old_offset == 0);
        CHECK(hunk.old_length == 0);
        CHECK(hunk.new_offset == 1);
        CHECK(hunk.new_length == 2);
        CHECK(hunk.added == 2);
        CHECK(hunk.deleted == 0);
        CHECK(hunk.corpus == "+one\n+two\n");
    }

    SUBCASE("empty_file_added_or_deleted_has_no_hunks") {
        ChangeRecord change;
        change.current_path = "empty.txt";
        change.kind = ChangeKind::Add;
        Status status;
        REQUIRE(build_hunks(change, "", "", false, status));
        CHECK(change.hunks.empty());
        CHECK(change.file_type == FileType::Text);
        CHECK(change.binary == false);

        change.kind = ChangeKind::Delete;
        REQUIRE(build_hunks(change, "", "", false, status));
        CHECK(change.hunks.empty());
    }

    SUBCASE("deleted_single_line_file") {
        auto change = record("gone.txt");
        change.kind = ChangeKind::Delete;
        Status status;
        REQUIRE(build_hunks(change, "only\n", "", false, status));

        const Hunk& hunk = change.hunks[0];
        CHECK(hunk.old_offset == 1);
        CHECK(hunk.old_length == 1);
        CHECK(hunk.new_offset == 0);
        CHECK(hunk.new_length == 0);
        CHECK(hunk.corpus == "-only\n");
    }

    SUBCASE("insertion_at_start_keeps_old_offset") {
        auto change = record("file.txt");
        Status status;
        REQUIRE(build_hunks(change, "b\n", "a\nb\n", false, status));

        const Hunk& hunk = change.hunks[0];
        CHECK(hunk.old_offset == 1);
        CHECK(hunk.old_length == 1);
        CHECK(hunk.new_offset == 1);
        CHECK(hunk.new_length == 2);
        CHECK(hunk.corpus == "+a\n b\n");
    }

    SUBCASE("identical_blobs_give_context_only_hunk") {
        auto change = record("same.txt");
        Status status;
        REQUIRE(build_hunks(change, "l1\nl2\nl3", "l1\nl2\nl3", true, status));

        REQUIRE(change.hunks.size() == 1);
        const Hunk& hunk = change.hunks[0];
        CHECK(hunk.old_offset == 1);
        CHECK(hunk.new_offset == 1);
        CHECK(hunk.old_length == 3);
        CHECK(hunk.new_length == 3);
        CHECK(hunk.added == 0);
        CHECK(hunk.deleted == 0);
        CHECK(hunk.old_eof_newline);
        CHECK(hunk.new_eof_newline);
        CHECK(hunk.corpus == " l1\n l2\n l3");
    }

    SUBCASE("equal_bodies_with_different_ids_have_one_full_hunk") {
        auto change = record("same.txt");
        Status status;
        REQUIRE(build_hunks(change, "p\nq\n", "p\nq\n", false, status));

        REQUIRE(change.hunks.size() == 1);
        const Hunk& hunk = change.hunks[0];
        CHECK(hunk.old_length == 2);
        CHECK(hunk.new_length == 2);
        CHECK(hunk.added == 0);
        CHECK(hunk.deleted == 0);
        CHECK(hunk.corpus == " p\n q\n");
    }

    SUBCASE("far_apart_changes_stay_in_one_hunk") {
        std::string old_body, new_body;
        for (int i = 0; i < 40; i++) {
            old_body += "line " + std::to_string(i) + "\n";
            new_body += (i == 2 || i == 37 ? "changed " : "line ") + std::to_string(i) + "\n";
        }
        auto change = record("long.txt");
        Status status;
        REQUIRE(build_hunks(change, old_body, new_body, false, status));

        REQUIRE(change.hunks.size() == 1);
        CHECK(change.hunks[0].old_length == 40);
        CHECK(change.hunks[0].new_length == 40);
        CHECK(change.hunks[0].added == 2);
        CHECK(change.hunks[0].deleted == 2);
    }

    SUBCASE("round_trip") {
        const std::vector<std::pair<std::string, std::string>> cases = {
            {"a\nb\nc\n", "a\nc\nd\n"},
            {"", "fresh\nfile"},
            {"tail", "tail\n"},
            {"x\ny\nz", "y\nz\nw"},
            {"same\n", "same\n"},
            {"one\ntwo\nthree\nfour\n", "zero\none\nthree\nfive\n"},
            {"\n\n\n", "\n"},
        };
        for (const auto& [old_body, new_body] : cases) {
            std::vector<Hunk> hunks;
            Status status;
            REQUIRE(text_hunks(old_body, new_body, "f", "f", hunks, status));
            REQUIRE(hunks.size() == 1);

            auto sides = reconstruct(hunks[0].corpus);
            CHECK(sides.old_body == old_body);
            CHECK(sides.new_body == new_body);
        }
    }

    SUBCASE("binary_image") {
        auto change = record("logo.png");
        Status status;
        std::string old_body("\x89PNG\0old", 8);
        std::string new_body("\x89PNG\0new!", 9);
        REQUIRE(build_hunks(change, old_body, new_body, false, status));

        CHECK(change.binary == true);
        CHECK(change.file_type == FileType::Image);
        CHECK(change.hunks.empty());
        REQUIRE(change.uploads.size() == 2);
        CHECK(change.uploads[0].side == UploadSide::Old);
        CHECK(change.uploads[0].bytes == old_body);
        CHECK(change.uploads[0].mime_type == "image/png");
        CHECK(change.uploads[1].side == UploadSide::New);
        CHECK(change.uploads[1].bytes.size() == 9);
        CHECK(!change.uploads[1].phid.has_value());
    }

    SUBCASE("binary_on_one_side_only") {
        auto change = record("blob.dat");
        Status status;
        REQUIRE(build_hunks(change, "text\n", std::string("bin\0ary", 7), false, status));

        CHECK(change.file_type == FileType::Binary);
        CHECK(change.uploads[0].mime_type == "application/octet-stream");
        CHECK(change.hunks.empty());
    }

    SUBCASE("image_detected_from_old_path") {
        auto change = record("picture");
        change.old_path = "picture.gif";
        change.kind = ChangeKind::MoveHere;
        Status status;
        REQUIRE(build_hunks(change, std::string("GIF\0", 4), std::string("GIF\0", 4), true, status));
        CHECK(change.file_type == FileType::Image);
    }
}
