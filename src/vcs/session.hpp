#pragma once

/*
    Identity cache over a Backend for the duration of one command.

    Each commit and each secondary hash is fetched from the backend at most
    once. Components receive the session explicitly; nothing is cached
    globally.
*/

#include "model/commit.hpp"
#include "util/status.hpp"
#include "vcs/backend.hpp"

#include <map>
#include <optional>
#include <string>

namespace phabstack {

class Session {
   public:
    explicit Session(Backend& backend) : backend_(backend) {}

    Backend&
    backend() {
        return backend_;
    }

    bool
    resolve(const std::string& rev, std::string& hash, Status& status);

    // The commit with its secondary hash filled in when that is cached.
    bool
    commit(const std::string& hash, CommitNode& commit, Status& status);

    bool
    secondary_hash(const std::string& hash, std::optional<std::string>& secondary, Status& status);

    void
    set_secondary_hash(const std::string& hash, const std::string& secondary);

   private:
    Backend& backend_;
    std::map<std::string, std::string> revisions_;
    std::map<std::string, CommitNode> commits_;
    std::map<std::string, std::optional<std::string>> secondary_hashes_;
};

}  // namespace phabstack
