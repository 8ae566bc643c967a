#include "output/wire.hpp"

#include <fmt/format.h>

using namespace phabstack;
using nlohmann::json;

namespace {

json
properties(const std::optional<std::string>& mode) {
    if (!mode) {
        return json::object();
    }
    return json{{"unix:filemode", *mode}};
}

json
optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json
hunk_to_wire(const Hunk& hunk) {
    return json{
        {"oldOffset", hunk.old_offset},
        {"oldLength", hunk.old_length},
        {"newOffset", hunk.new_offset},
        {"newLength", hunk.new_length},
        {"addLines", hunk.added},
        {"delLines", hunk.deleted},
        {"isMissingOldNewline", !hunk.old_eof_newline},
        {"isMissingNewNewline", !hunk.new_eof_newline},
        {"corpus", hunk.corpus},
    };
}

}  // namespace

bool
phabstack::check_uploads(const ChangeSet& changes, Status& status) {
    for (const auto& [path, change] : changes) {
        for (const auto& upload : change.uploads) {
            if (!upload.phid) {
                return status.set_error(ErrorKind::User,
                                        fmt::format("'{}' has {} content, which needs a file upload first",
                                                    path, repr(change.file_type)));
            }
        }
    }
    return true;
}

bool
phabstack::to_wire(const ChangeRecord& change, const CommitNode& commit, json& payload, Status& status) {
    if (!change.kind) {
        return status.set_error(ErrorKind::Internal, fmt::format("'{}' has no change kind", change.current_path));
    }

    json metadata = json::object();
    for (const auto& upload : change.uploads) {
        const std::string side = repr(upload.side);
        if (!upload.phid) {
            return status.set_error(ErrorKind::Internal, fmt::format("{} side of '{}' was not uploaded", side,
                                                                     change.current_path));
        }
        metadata[side + ":binary-id"] = *upload.phid;
        metadata[side + ":file:size"] = upload.bytes.size();
        metadata[side + ":file:mime-type"] = upload.mime_type;
    }

    json hunks = json::array();
    for (const auto& hunk : change.hunks) {
        hunks.push_back(hunk_to_wire(hunk));
    }

    payload = json{
        {"metadata", metadata},
        {"oldPath", optional_string(change.old_path)},
        {"currentPath", change.current_path},
        {"awayPaths", change.away_paths},
        {"oldProperties", properties(change.old_mode)},
        {"newProperties", properties(change.new_mode)},
        {"commitHash", optional_string(commit.secondary_hash)},
        {"type", kind_code(*change.kind)},
        {"fileType", file_type_code(change.file_type)},
        {"hunks", hunks},
    };
    return true;
}

bool
phabstack::to_wire_changes(const ChangeSet& changes, const CommitNode& commit, json& payload, Status& status) {
    payload = json::array();
    for (const auto& [path, change] : changes) {
        json item;
        if (!to_wire(change, commit, item, status)) {
            return false;
        }
        payload.push_back(std::move(item));
    }
    return true;
}

bool
phabstack::to_diff_payload(const ChangeSet& changes,
                           const CommitNode& commit,
                           const std::string& base_secondary,
                           json& payload,
                           Status& status) {
    json wire_changes;
    if (!to_wire_changes(changes, commit, wire_changes, status)) {
        return false;
    }

    payload = json{
        {"changes", wire_changes},
        {"sourceControlSystem", "hg"},
        {"sourceControlPath", "/"},
        {"sourceControlBaseRevision", base_secondary},
        {"creationMethod", "phabstack"},
        {"lintStatus", "none"},
        {"unitStatus", "none"},
        {"branch", "HEAD"},
    };
    return true;
}
