#pragma once

/*
    The version control system the commit stack lives in.

    Every call blocks until the backend answered. Implementations report
    unknown revisions as ErrorKind::User and failed commands as
    ErrorKind::Process.
*/

#include "model/commit.hpp"
#include "util/status.hpp"

#include <optional>
#include <string>

namespace phabstack {

class Backend {
   public:
    virtual ~Backend() = default;

    // Full hash of the commit `rev` names.
    virtual bool
    resolve(const std::string& rev, std::string& hash, Status& status) = 0;

    // Metadata of one commit. The secondary hash is left unset.
    virtual bool
    read_commit(const std::string& hash, CommitNode& commit, Status& status) = 0;

    // NUL-separated raw change listing of a commit against its parent.
    virtual bool
    raw_changes(const std::string& hash, std::string& listing, Status& status) = 0;

    virtual bool
    read_blob(const std::string& blob, std::string& body, Status& status) = 0;

    // Mercurial hash of a commit, unset when the commit is unknown to it.
    virtual bool
    secondary_hash(const std::string& hash, std::optional<std::string>& secondary, Status& status) = 0;

    // Write an uncompressed HG10 bundle holding the changesets base..head.
    virtual bool
    export_bundle(const std::string& path, const std::string& base, const std::string& head, Status& status) = 0;

    // New commit with the tree and authorship of `commit`, on top of `parent`.
    virtual bool
    commit_tree(const CommitNode& commit,
                const std::string& parent,
                const std::string& message,
                std::string& new_hash,
                Status& status) = 0;

    // Move `ref` to `new_hash` only if it still points at `old_hash`.
    virtual bool
    update_ref(const std::string& ref, const std::string& new_hash, const std::string& old_hash, Status& status) = 0;
};

}  // namespace phabstack
