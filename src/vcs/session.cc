#include "vcs/session.hpp"

using namespace phabstack;

bool
Session::resolve(const std::string& rev, std::string& hash, Status& status) {
    if (auto it = revisions_.find(rev); it != revisions_.end()) {
        hash = it->second;
        return true;
    }
    if (!backend_.resolve(rev, hash, status)) {
        return false;
    }
    revisions_[rev] = hash;
    return true;
}

bool
Session::commit(const std::string& hash, CommitNode& commit, Status& status) {
    auto it = commits_.find(hash);
    if (it == commits_.end()) {
        CommitNode node;
        if (!backend_.read_commit(hash, node, status)) {
            return false;
        }
        it = commits_.emplace(hash, std::move(node)).first;
    }

    commit = it->second;
    if (auto secondary = secondary_hashes_.find(hash); secondary != secondary_hashes_.end()) {
        commit.secondary_hash = secondary->second;
    }
    return true;
}

bool
Session::secondary_hash(const std::string& hash, std::optional<std::string>& secondary, Status& status) {
    if (auto it = secondary_hashes_.find(hash); it != secondary_hashes_.end()) {
        secondary = it->second;
        return true;
    }
    if (!backend_.secondary_hash(hash, secondary, status)) {
        return false;
    }
    secondary_hashes_[hash] = secondary;
    return true;
}

void
Session::set_secondary_hash(const std::string& hash, const std::string& secondary) {
    secondary_hashes_[hash] = secondary;
}
