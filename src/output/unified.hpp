#pragma once

#include "algorithms/algorithm.hpp"
#include "processing/diff_hunk.hpp"
#include "util/readlines.hpp"

#include <string>
#include <vector>

namespace phabstack {

struct HunkHeader {
    int64_t old_offset = 0;
    int64_t old_length = 0;
    int64_t new_offset = 0;
    int64_t new_length = 0;
};

// "@@ -a,b +c,d @@\n", where a range of exactly one line is printed without
// its length.
std::string
format_hunk_header(const DiffHunk& hunk);

// Parse a header produced by format_hunk_header (or any unified diff). An
// omitted length means 1.
bool
parse_hunk_header(const std::string& header, HunkHeader& result);

// Render "--- A_name", "+++ B_name", then every hunk header followed by its
// lines prefixed with ' ', '-' or '+'. Line text is copied verbatim, so the
// last line of a side may lack its '\n'.
std::vector<std::string>
unified_diff_render(const DiffInput<Line>& diff_input, const std::vector<DiffHunk>& hunks);

}  // namespace phabstack
