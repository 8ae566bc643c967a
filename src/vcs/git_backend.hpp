#pragma once

#include "util/process.hpp"
#include "vcs/backend.hpp"

#include <string>
#include <vector>

namespace phabstack {

// Backend running the git command line (and git-cinnabar for the
// Mercurial side) inside one repository.
class GitBackend : public Backend {
   public:
    GitBackend(std::string git_command, std::string work_dir, bool cinnabar = true);

    bool
    resolve(const std::string& rev, std::string& hash, Status& status) override;

    bool
    read_commit(const std::string& hash, CommitNode& commit, Status& status) override;

    bool
    raw_changes(const std::string& hash, std::string& listing, Status& status) override;

    bool
    read_blob(const std::string& blob, std::string& body, Status& status) override;

    bool
    secondary_hash(const std::string& hash, std::optional<std::string>& secondary, Status& status) override;

    bool
    export_bundle(const std::string& path, const std::string& base, const std::string& head, Status& status) override;

    bool
    commit_tree(const CommitNode& commit,
                const std::string& parent,
                const std::string& message,
                std::string& new_hash,
                Status& status) override;

    bool
    update_ref(const std::string& ref, const std::string& new_hash, const std::string& old_hash, Status& status) override;

   private:
    bool
    git(std::vector<std::string> args, ProcessResult& result, Status& status, ProcessOptions options = {});

    bool
    require_cinnabar(Status& status) const;

    std::string git_command_;
    std::string work_dir_;
    bool cinnabar_;
};

}  // namespace phabstack
