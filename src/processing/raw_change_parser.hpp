#pragma once

/*
    Raw change listing -> ChangeSet.

    The listing is what `git diff-tree -r -z --raw` prints: a metadata token
    `:old-mode new-mode old-blob new-blob status[score]` followed by one path,
    or by source and destination for renames and copies, every token
    terminated by a NUL byte.
*/

#include "model/change.hpp"
#include "model/commit.hpp"
#include "util/status.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace phabstack {

class Backend;

struct RawChange {
    std::string old_mode;
    std::string new_mode;
    std::string old_blob;
    std::string new_blob;
    char status = 0;
    std::optional<int> score;

    // Destination for renames and copies.
    std::string path;
    std::optional<std::string> source_path;
};

// True for the all-zero id the backend prints for a missing side.
bool
is_null_blob(const std::string& blob);

bool
parse_raw_changes(std::string_view listing, std::vector<RawChange>& records, Status& status);

// Apply the records to `changes` in order. Rename and copy sources are
// classified by what they already were, so record order matters.
bool
merge_raw_changes(const std::vector<RawChange>& records, ChangeSet& changes, Status& status);

// Listing, classification and hunks for every path `commit` touches.
bool
build_change_set(Backend& backend, const CommitNode& commit, ChangeSet& changes, Status& status);

}  // namespace phabstack
