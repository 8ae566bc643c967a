#pragma once

/*
    Turn the old and new body of one path into review hunks.

    Binary content (a NUL byte on either side) gets no hunks; both bodies are
    attached as upload descriptors instead. Text content gets a single hunk
    spanning the whole file, so the review service always has full context.
*/

#include "model/change.hpp"
#include "util/readlines.hpp"
#include "util/status.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace phabstack {

bool
is_binary(std::string_view body);

// Hunk for content known to be unchanged: every line is context.
Hunk
context_only_hunk(const std::vector<Line>& lines);

// Full-context unified diff of two text bodies, parsed into hunks.
bool
text_hunks(const std::string& old_body,
           const std::string& new_body,
           const std::string& old_path,
           const std::string& new_path,
           std::vector<Hunk>& hunks,
           Status& status);

// Classify the change and fill its hunks or uploads. `identical` means the
// backend proved both sides equal (same blob id).
bool
build_hunks(ChangeRecord& change,
            const std::string& old_body,
            const std::string& new_body,
            bool identical,
            Status& status);

}  // namespace phabstack
