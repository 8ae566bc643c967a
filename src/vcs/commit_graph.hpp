#pragma once

#include "model/commit.hpp"
#include "util/status.hpp"
#include "vcs/session.hpp"

#include <string>
#include <vector>

namespace phabstack {

struct RangeResult {
    // Excluded base of the range.
    std::string start;

    // What the ref resolved to.
    std::string head;

    // Commits to publish, oldest first.
    std::vector<CommitNode> push;

    // Commits between the range end and the ref, oldest first. They are
    // re-parented when the push list is rewritten.
    std::vector<CommitNode> reparent;
};

// Partition the history behind `ref` for the range `A..B` (an empty B means
// the ref) or `C` (meaning `C^..C`). Every step must follow a single parent.
bool
resolve_range(Session& session, const std::string& ref, const std::string& revspec, RangeResult& range,
              Status& status);

}  // namespace phabstack
