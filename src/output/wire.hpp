#pragma once

/*
    ChangeRecord -> review service JSON.

    Every upload must carry its binary id by now; a missing one means the
    caller skipped the upload step and is reported as ErrorKind::Internal.
*/

#include "model/change.hpp"
#include "model/commit.hpp"
#include "util/status.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace phabstack {

// User error naming the first path whose content still waits for an upload.
bool
check_uploads(const ChangeSet& changes, Status& status);

bool
to_wire(const ChangeRecord& change, const CommitNode& commit, nlohmann::json& payload, Status& status);

// Array of the changes in path order.
bool
to_wire_changes(const ChangeSet& changes, const CommitNode& commit, nlohmann::json& payload, Status& status);

// Request body for creating a diff from one commit on top of `base_secondary`.
bool
to_diff_payload(const ChangeSet& changes,
                const CommitNode& commit,
                const std::string& base_secondary,
                nlohmann::json& payload,
                Status& status);

}  // namespace phabstack
