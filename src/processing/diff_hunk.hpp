#pragma once

/*
    Compose diff hunks out of an edit sequence.

    Hunk ranges use unified diff numbering: starts are 1-based, and an empty
    range starts at the line before it (0 for an empty side).
*/

#include "algorithms/algorithm.hpp"

namespace phabstack {

struct DiffHunk {
    int64_t from_start = 0;
    int64_t from_count = 0;
    int64_t to_start = 0;
    int64_t to_count = 0;

    std::vector<Edit> edit_units;
};

std::vector<DiffHunk>
compose_hunks(const std::vector<Edit>& edit_sequence, const int64_t context_size);

}  // namespace phabstack
