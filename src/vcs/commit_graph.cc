#include "vcs/commit_graph.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace phabstack;

namespace {

// Collect commits from `from` down to, but excluding, `until`; oldest first.
bool
walk_until(Session& session,
           const std::string& from,
           const std::string& until,
           std::vector<CommitNode>& commits,
           Status& status) {
    std::string current = from;
    while (current != until) {
        CommitNode commit;
        if (!session.commit(current, commit, status)) {
            return false;
        }

        auto parent = commit.parent();
        if (!parent) {
            const char* reason = commit.parents.empty() ? "reached the root commit" : "non-linear history";
            return status.set_error(ErrorKind::User,
                                    fmt::format("{} is not an ancestor of {}: {} at {}", until.substr(0, 12),
                                                from.substr(0, 12), reason, commit.short_hash()));
        }

        commits.push_back(std::move(commit));
        current = *parent;
    }

    std::reverse(commits.begin(), commits.end());
    return true;
}

}  // namespace

bool
phabstack::resolve_range(Session& session,
                         const std::string& ref,
                         const std::string& revspec,
                         RangeResult& range,
                         Status& status) {
    range = RangeResult{};
    if (!session.resolve(ref, range.head, status)) {
        return false;
    }

    std::string end;
    auto dots = revspec.find("..");
    if (dots != std::string::npos) {
        std::string start_rev = revspec.substr(0, dots);
        std::string end_rev = revspec.substr(dots + 2);
        if (start_rev.empty()) {
            return status.set_error(ErrorKind::User, fmt::format("range '{}' has no start", revspec));
        }
        if (!session.resolve(start_rev, range.start, status)) {
            return false;
        }
        if (end_rev.empty()) {
            end = range.head;
        } else if (!session.resolve(end_rev, end, status)) {
            return false;
        }
    } else {
        if (revspec.empty()) {
            return status.set_error(ErrorKind::User, "empty revision range");
        }
        if (!session.resolve(revspec, end, status)) {
            return false;
        }
        CommitNode commit;
        if (!session.commit(end, commit, status)) {
            return false;
        }
        auto parent = commit.parent();
        if (!parent) {
            return status.set_error(ErrorKind::User,
                                    fmt::format("{} has {} parents, expected one", commit.short_hash(),
                                                commit.parents.size()));
        }
        range.start = *parent;
    }

    if (!walk_until(session, range.head, end, range.reparent, status)) {
        return false;
    }
    if (!walk_until(session, end, range.start, range.push, status)) {
        return false;
    }
    if (range.push.empty()) {
        return status.set_error(ErrorKind::User, fmt::format("range '{}' contains no commits", revspec));
    }

    spdlog::debug("range {}: {} to push, {} to reparent", revspec, range.push.size(), range.reparent.size());
    return true;
}
