#include "vcs/rewrite.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <vector>

using namespace phabstack;

bool
phabstack::rewrite_stack(Session& session,
                         const RangeResult& range,
                         const std::map<std::string, std::string>& messages,
                         const std::string& ref,
                         RewriteResult& result,
                         Status& status) {
    result = RewriteResult{};

    std::vector<const CommitNode*> stack;
    for (const auto& commit : range.push) {
        stack.push_back(&commit);
    }
    for (const auto& commit : range.reparent) {
        stack.push_back(&commit);
    }

    std::string parent = range.start;
    bool changed = false;
    for (const CommitNode* commit : stack) {
        auto it = messages.find(commit->hash);
        const std::string message = it == messages.end() ? commit->message : it->second;

        if (!changed && message == commit->message) {
            parent = commit->hash;
            continue;
        }
        changed = true;

        std::string new_hash;
        if (!session.backend().commit_tree(*commit, parent, message, new_hash, status)) {
            return false;
        }
        spdlog::debug("rewrote {} as {}", commit->short_hash(), new_hash.substr(0, 12));
        result.replaced[commit->hash] = new_hash;
        parent = new_hash;
    }

    if (!changed) {
        result.head = range.head;
        return true;
    }

    if (!session.backend().update_ref(ref, parent, range.head, status)) {
        return false;
    }
    result.head = parent;
    spdlog::info("{} now points at {} ({} commits rewritten)", ref, parent.substr(0, 12), result.replaced.size());
    return true;
}
