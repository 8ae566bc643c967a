#include "output/wire.hpp"

#include "processing/hunk_builder.hpp"

#include <doctest.h>

#include <string>

using namespace phabstack;
using nlohmann::json;

namespace {

CommitNode
commit_with_secondary() {
    CommitNode commit;
    commit.hash = "c1";
    commit.secondary_hash = std::string(40, 'a');
    return commit;
}

}  // namespace

TEST_CASE("to_wire") {
    CommitNode commit = commit_with_secondary();
    Status status;
    json payload;

    SUBCASE("text_change") {
        ChangeRecord change;
        change.current_path = "file.txt";
        change.old_path = "file.txt";
        change.kind = ChangeKind::Change;
        REQUIRE(build_hunks(change, "a\nb\n", "a\nc\n", false, status));

        REQUIRE(to_wire(change, commit, payload, status));
        CHECK(payload["metadata"] == json::object());
        CHECK(payload["oldPath"] == "file.txt");
        CHECK(payload["currentPath"] == "file.txt");
        CHECK(payload["awayPaths"] == json::array());
        CHECK(payload["oldProperties"] == json::object());
        CHECK(payload["newProperties"] == json::object());
        CHECK(payload["commitHash"] == std::string(40, 'a'));
        CHECK(payload["type"] == 2);
        CHECK(payload["fileType"] == 1);

        REQUIRE(payload["hunks"].size() == 1);
        const json& hunk = payload["hunks"][0];
        CHECK(hunk["oldOffset"] == 1);
        CHECK(hunk["oldLength"] == 2);
        CHECK(hunk["newOffset"] == 1);
        CHECK(hunk["newLength"] == 2);
        CHECK(hunk["addLines"] == 1);
        CHECK(hunk["delLines"] == 1);
        CHECK(hunk["isMissingOldNewline"] == false);
        CHECK(hunk["isMissingNewNewline"] == false);
        CHECK(hunk["corpus"] == " a\n-b\n+c\n");
    }

    SUBCASE("added_file_with_mode") {
        ChangeRecord change;
        change.current_path = "run.sh";
        change.kind = ChangeKind::Add;
        change.new_mode = "100755";
        REQUIRE(build_hunks(change, "", "x", false, status));

        REQUIRE(to_wire(change, commit, payload, status));
        CHECK(payload["oldPath"].is_null());
        CHECK(payload["newProperties"]["unix:filemode"] == "100755");
        CHECK(payload["type"] == 1);
        CHECK(payload["hunks"][0]["isMissingNewNewline"] == true);
        CHECK(payload["hunks"][0]["isMissingOldNewline"] == false);
    }

    SUBCASE("multicopy_source") {
        ChangeRecord change;
        change.current_path = "S";
        change.old_path = "S";
        change.kind = ChangeKind::Multicopy;
        change.away_paths = {"D1", "D2"};

        REQUIRE(to_wire(change, commit, payload, status));
        CHECK(payload["type"] == 8);
        CHECK(payload["awayPaths"] == json{"D1", "D2"});
        CHECK(payload["hunks"] == json::array());
    }

    SUBCASE("binary_uploads") {
        ChangeRecord change;
        change.current_path = "logo.png";
        change.old_path = "logo.png";
        change.kind = ChangeKind::Change;
        REQUIRE(build_hunks(change, std::string("\x89PNG\0a", 6), std::string("\x89PNG\0bc", 7), false, status));

        CHECK_FALSE(to_wire(change, commit, payload, status));
        CHECK(status.kind == ErrorKind::Internal);

        status = Status{};
        change.uploads[0].phid = "PHID-FILE-old";
        change.uploads[1].phid = "PHID-FILE-new";
        REQUIRE(to_wire(change, commit, payload, status));
        CHECK(payload["fileType"] == 2);
        CHECK(payload["metadata"]["old:binary-id"] == "PHID-FILE-old");
        CHECK(payload["metadata"]["new:binary-id"] == "PHID-FILE-new");
        CHECK(payload["metadata"]["old:file:size"] == 6);
        CHECK(payload["metadata"]["new:file:size"] == 7);
        CHECK(payload["metadata"]["new:file:mime-type"] == "image/png");
    }

    SUBCASE("unresolved_secondary") {
        ChangeRecord change;
        change.current_path = "S";
        change.kind = ChangeKind::Delete;
        commit.secondary_hash.reset();
        REQUIRE(to_wire(change, commit, payload, status));
        CHECK(payload["commitHash"].is_null());
    }

    SUBCASE("missing_kind") {
        ChangeRecord change;
        change.current_path = "S";
        CHECK_FALSE(to_wire(change, commit, payload, status));
        CHECK(status.kind == ErrorKind::Internal);
    }
}

TEST_CASE("check_uploads") {
    Status status;
    ChangeSet changes;
    changes["a.txt"].current_path = "a.txt";
    changes["a.txt"].kind = ChangeKind::Change;
    REQUIRE(build_hunks(changes["a.txt"], "x\n", "y\n", false, status));
    CHECK(check_uploads(changes, status));

    auto& image = changes["logo.png"];
    image.current_path = "logo.png";
    image.kind = ChangeKind::Add;
    REQUIRE(build_hunks(image, "", std::string("\x89PNG\0", 5), false, status));

    CHECK_FALSE(check_uploads(changes, status));
    CHECK(status.kind == ErrorKind::User);
    CHECK(status.error.find("'logo.png'") != std::string::npos);

    status = Status{};
    image.uploads[0].phid = "PHID-FILE-old";
    image.uploads[1].phid = "PHID-FILE-new";
    CHECK(check_uploads(changes, status));
}

TEST_CASE("to_diff_payload") {
    CommitNode commit = commit_with_secondary();
    Status status;

    ChangeSet changes;
    changes["b.txt"].current_path = "b.txt";
    changes["b.txt"].kind = ChangeKind::Delete;
    changes["a.txt"].current_path = "a.txt";
    changes["a.txt"].kind = ChangeKind::Add;

    json payload;
    REQUIRE(to_diff_payload(changes, commit, std::string(40, 'b'), payload, status));
    CHECK(payload["sourceControlSystem"] == "hg");
    CHECK(payload["sourceControlPath"] == "/");
    CHECK(payload["sourceControlBaseRevision"] == std::string(40, 'b'));
    CHECK(payload["creationMethod"] == "phabstack");
    CHECK(payload["lintStatus"] == "none");
    CHECK(payload["unitStatus"] == "none");
    CHECK(payload["branch"] == "HEAD");
    REQUIRE(payload["changes"].size() == 2);
    CHECK(payload["changes"][0]["currentPath"] == "a.txt");
    CHECK(payload["changes"][1]["currentPath"] == "b.txt");
}
