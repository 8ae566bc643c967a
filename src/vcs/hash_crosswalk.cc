#include "vcs/hash_crosswalk.hpp"

#include "util/scratch_dir.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace phabstack;

namespace {

// Walk parents from the first commit until one has a real secondary hash.
// The commits passed on the way are returned oldest first.
bool
find_anchor(Session& session,
            const CommitNode& first,
            CommitNode& anchor,
            std::vector<CommitNode>& unresolved,
            Status& status) {
    auto parent = first.parent();
    while (parent) {
        CommitNode commit;
        if (!session.commit(*parent, commit, status)) {
            return false;
        }
        if (!session.secondary_hash(commit.hash, commit.secondary_hash, status)) {
            return false;
        }
        if (commit.has_real_secondary_hash()) {
            anchor = std::move(commit);
            std::reverse(unresolved.begin(), unresolved.end());
            return true;
        }
        parent = commit.parent();
        unresolved.push_back(std::move(commit));
    }

    return status.set_error(ErrorKind::User,
                            fmt::format("no ancestor of {} has a known Mercurial hash", first.short_hash()));
}

}  // namespace

bool
phabstack::propagate_secondary_hashes(const std::string& anchor_secondary,
                                      std::vector<CommitNode>& commits,
                                      const HashMapping& mapping,
                                      Status& status) {
    std::string previous = anchor_secondary;
    for (auto& commit : commits) {
        auto it = mapping.find(previous);
        if (it == mapping.end()) {
            return status.set_error(ErrorKind::User,
                                    fmt::format("bundle has no child of {} for {}, it is incomplete", previous,
                                                commit.short_hash()));
        }
        commit.secondary_hash = it->second;
        previous = it->second;
    }
    return true;
}

bool
phabstack::ensure_secondary_hashes(Session& session, std::vector<CommitNode>& push, Status& status) {
    if (push.empty()) {
        return true;
    }

    bool all_known = true;
    for (auto& commit : push) {
        if (!session.secondary_hash(commit.hash, commit.secondary_hash, status)) {
            return false;
        }
        all_known = all_known && commit.has_real_secondary_hash();
    }
    if (all_known) {
        return true;
    }

    CommitNode anchor;
    std::vector<CommitNode> commits;
    if (!find_anchor(session, push.front(), anchor, commits, status)) {
        return false;
    }
    const size_t unresolved = commits.size();
    commits.insert(commits.end(), push.begin(), push.end());

    spdlog::info("deriving Mercurial hashes for {} commits from {}", commits.size(), anchor.short_hash());

    ScratchDir scratch;
    if (!scratch.create("phabstack-", status)) {
        return false;
    }
    const std::string bundle_path = (scratch.path() / "cinnabar.hg").string();
    if (!session.backend().export_bundle(bundle_path, anchor.hash, push.back().hash, status)) {
        return false;
    }

    std::vector<uint8_t> bytes;
    HashMapping mapping;
    if (!read_bundle_file(bundle_path, bytes, status) || !parse_bundle(bytes, mapping, status)) {
        return false;
    }
    if (!propagate_secondary_hashes(*anchor.secondary_hash, commits, mapping, status)) {
        return false;
    }

    for (size_t i = 0; i < commits.size(); i++) {
        session.set_secondary_hash(commits[i].hash, *commits[i].secondary_hash);
        if (i >= unresolved) {
            push[i - unresolved].secondary_hash = commits[i].secondary_hash;
        }
    }
    return true;
}
