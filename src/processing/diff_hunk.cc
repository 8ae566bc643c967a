#include "diff_hunk.hpp"

#include <algorithm>

using namespace phabstack;

namespace {

struct HunkRange {
    int64_t start;
    int64_t end;
};

// Take a sequence of edits and filter out all common lines.
// Return a list of all ranges with consecutive delete and insertions.
std::vector<HunkRange>
find_hunk_ranges(const std::vector<Edit>& edit_sequence) {
    std::vector<HunkRange> hunk_ranges;
    hunk_ranges.push_back({-1, -1});
    for (size_t i = 0; i < edit_sequence.size(); i++) {
        HunkRange& curr = hunk_ranges.back();
        const EditType etype = edit_sequence[i].type;
        const bool in_hunk = curr.start != -1;
        if (!in_hunk && etype != EditType::Common) {
            curr.start = static_cast<int64_t>(i);
            curr.end = static_cast<int64_t>(i);
        } else if (in_hunk) {
            if (etype == EditType::Common) {
                hunk_ranges.push_back({-1, -1});
            } else {
                curr.end = static_cast<int64_t>(i);
            }
        }
    }

    if (hunk_ranges.back().start == -1) {
        hunk_ranges.pop_back();
    }

    return hunk_ranges;
}

// Combine adjacent hunk ranges. Take number of context lines into consideration.
std::vector<HunkRange>
extend_hunk_ranges(const std::vector<Edit>& edit_sequence,
                   const std::vector<HunkRange>& hunk_ranges,
                   const int64_t context_size) {
    std::vector<HunkRange> context_ranges = hunk_ranges;
    for (size_t i = 0; i < context_ranges.size(); i++) {
        const bool last_iteration = i == context_ranges.size() - 1;

        HunkRange* p = i == 0 ? nullptr : &context_ranges[i - 1];
        HunkRange* h = &context_ranges[i];
        HunkRange* n = last_iteration ? nullptr : &context_ranges[i + 1];

        // Combine hunks if they are separated by at most ´context_size´ number
        // of common lines on each side.
        if (n && n->start - h->end <= context_size * 2 + 1) {
            context_ranges[i] = {h->start, n->end};
            context_ranges.erase(context_ranges.begin() + static_cast<std::ptrdiff_t>(i) + 1);
            i -= 1;
            continue;
        }

        // Adjust context lines for current hunk. Don't extend past the
        // previous hunk, the next hunk, or the edit sequence.
        const int64_t p_end = p ? p->end + 1 : 0;
        h->start = std::max(p_end, h->start - context_size);

        if (n) {
            h->end = std::min(n->start - 1, h->end + context_size);
        } else {
            h->end = std::min(h->end + context_size, static_cast<int64_t>(edit_sequence.size()) - 1);
        }
    }
    return context_ranges;
}

}  // namespace

// Compose a list of hunks from a sequence of edits.
std::vector<DiffHunk>
phabstack::compose_hunks(const std::vector<Edit>& edit_sequence, const int64_t context_size) {
    // Start by finding all hunks without taking context size into consideration.
    auto hunk_ranges = find_hunk_ranges(edit_sequence);

    // And then extend the ranges to include context lines. Join adjacent hunk ranges.
    std::vector<HunkRange> hunk_ranges_with_context =
        extend_hunk_ranges(edit_sequence, hunk_ranges, context_size);

    // Number of A and B lines consumed before each edit.
    struct LinesBefore {
        int64_t a = 0;
        int64_t b = 0;
    };
    std::vector<LinesBefore> lines_before;
    lines_before.reserve(edit_sequence.size());
    {
        LinesBefore count;
        for (const auto& e : edit_sequence) {
            lines_before.push_back(count);
            if (e.type != EditType::Insert) {
                count.a++;
            }
            if (e.type != EditType::Delete) {
                count.b++;
            }
        }
    }

    std::vector<DiffHunk> hunks;
    for (const auto& hunk_range : hunk_ranges_with_context) {
        auto range_start = static_cast<size_t>(hunk_range.start);
        auto range_end = static_cast<size_t>(hunk_range.end);

        DiffHunk hunk;
        for (auto i = range_start; i <= range_end; i++) {
            const auto& e = edit_sequence[i];
            if (e.type != EditType::Insert) {
                hunk.from_count++;
            }
            if (e.type != EditType::Delete) {
                hunk.to_count++;
            }
            hunk.edit_units.push_back(e);
        }

        // A non-empty range starts at its first line; an empty range at the
        // line preceding the hunk.
        hunk.from_start = lines_before[range_start].a + (hunk.from_count > 0 ? 1 : 0);
        hunk.to_start = lines_before[range_start].b + (hunk.to_count > 0 ? 1 : 0);

        hunks.push_back(std::move(hunk));
    }

    return hunks;
}
