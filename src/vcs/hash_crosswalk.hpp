#pragma once

/*
    Derive the Mercurial hash of commits that do not have one yet.

    The nearest ancestor with a known Mercurial hash is the anchor. The
    backend exports a bundle from the anchor to the last commit, and the
    parent -> child relation recorded in the bundle is followed from the
    anchor's hash to assign every commit after it a hash of its own.
*/

#include "model/commit.hpp"
#include "util/status.hpp"
#include "vcs/bundle.hpp"
#include "vcs/session.hpp"

#include <string>
#include <vector>

namespace phabstack {

// Fill in the secondary hash of every commit in `push` (oldest first).
bool
ensure_secondary_hashes(Session& session, std::vector<CommitNode>& push, Status& status);

// Assign `commits` (oldest first) their hashes by following `mapping` from
// `anchor_secondary`.
bool
propagate_secondary_hashes(const std::string& anchor_secondary,
                           std::vector<CommitNode>& commits,
                           const HashMapping& mapping,
                           Status& status);

}  // namespace phabstack
