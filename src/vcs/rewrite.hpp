#pragma once

#include "util/status.hpp"
#include "vcs/commit_graph.hpp"
#include "vcs/session.hpp"

#include <map>
#include <string>

namespace phabstack {

struct RewriteResult {
    std::string head;

    // Old hash -> new hash for every re-created commit.
    std::map<std::string, std::string> replaced;
};

// Re-create the push and reparent lists of `range` with the messages in
// `messages` (keyed by old hash), then move `ref` once from the originally
// resolved head to the new tip. Nothing moves when any step fails.
bool
rewrite_stack(Session& session,
              const RangeResult& range,
              const std::map<std::string, std::string>& messages,
              const std::string& ref,
              RewriteResult& result,
              Status& status);

}  // namespace phabstack
