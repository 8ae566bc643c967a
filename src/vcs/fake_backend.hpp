#pragma once

// In-memory backend for tests.

#include "vcs/backend.hpp"

#include <fmt/format.h>

#include <fstream>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace phabstack {

class FakeBackend : public Backend {
   public:
    std::map<std::string, std::string> refs;
    std::map<std::string, CommitNode> commits;
    std::map<std::string, std::string> listings;
    std::map<std::string, std::string> blobs;
    std::map<std::string, std::string> secondary;

    // Bytes written by export_bundle.
    std::string bundle;
    std::vector<std::pair<std::string, std::string>> bundle_requests;

    std::vector<std::tuple<std::string, std::string, std::string>> ref_updates;
    std::string fail_commit_tree_for;

    int read_commit_calls = 0;
    int secondary_hash_calls = 0;

    CommitNode&
    add_commit(const std::string& hash,
               std::vector<std::string> parents,
               const std::string& title = "",
               const std::string& body = "") {
        CommitNode commit;
        commit.hash = hash;
        commit.parents = std::move(parents);
        commit.tree = "tree-" + hash;
        commit.author_name = "Ada";
        commit.author_email = "ada@example.com";
        commit.author_date = "1700000000 +0000";
        std::string message = title.empty() ? "commit " + hash : title;
        if (!body.empty()) {
            message += "\n\n" + body;
        }
        commit.set_message(message + "\n");
        return commits[hash] = commit;
    }

    // Linear history c1 <- c2 <- ... <- cN with `ref` at the tip.
    void
    add_chain(int count, const std::string& ref = "HEAD") {
        std::string parent;
        for (int i = 1; i <= count; ++i) {
            std::string hash = fmt::format("c{}", i);
            add_commit(hash, parent.empty() ? std::vector<std::string>{} : std::vector<std::string>{parent});
            parent = hash;
        }
        refs[ref] = parent;
    }

    bool
    resolve(const std::string& rev, std::string& hash, Status& status) override {
        if (auto it = refs.find(rev); it != refs.end()) {
            hash = it->second;
            return true;
        }
        if (commits.count(rev) != 0) {
            hash = rev;
            return true;
        }
        return status.set_error(ErrorKind::User, fmt::format("unknown revision '{}'", rev));
    }

    bool
    read_commit(const std::string& hash, CommitNode& commit, Status& status) override {
        ++read_commit_calls;
        auto it = commits.find(hash);
        if (it == commits.end()) {
            return status.set_error(ErrorKind::User, fmt::format("unknown commit '{}'", hash));
        }
        commit = it->second;
        commit.secondary_hash.reset();
        return true;
    }

    bool
    raw_changes(const std::string& hash, std::string& listing, Status& status) override {
        auto it = listings.find(hash);
        if (it == listings.end()) {
            return status.set_error(ErrorKind::Process, fmt::format("no listing for '{}'", hash));
        }
        listing = it->second;
        return true;
    }

    bool
    read_blob(const std::string& blob, std::string& body, Status& status) override {
        auto it = blobs.find(blob);
        if (it == blobs.end()) {
            return status.set_error(ErrorKind::Process, fmt::format("no blob '{}'", blob));
        }
        body = it->second;
        return true;
    }

    bool
    secondary_hash(const std::string& hash, std::optional<std::string>& result, Status&) override {
        ++secondary_hash_calls;
        auto it = secondary.find(hash);
        result = it == secondary.end() ? std::nullopt : std::optional<std::string>(it->second);
        return true;
    }

    bool
    export_bundle(const std::string& path, const std::string& base, const std::string& head, Status& status) override {
        bundle_requests.emplace_back(base, head);
        std::ofstream out(path, std::ios::binary);
        out.write(bundle.data(), static_cast<std::streamsize>(bundle.size()));
        if (!out) {
            return status.set_error(ErrorKind::Process, fmt::format("could not write '{}'", path));
        }
        return true;
    }

    bool
    commit_tree(const CommitNode& commit,
                const std::string& parent,
                const std::string& message,
                std::string& new_hash,
                Status& status) override {
        if (commit.hash == fail_commit_tree_for) {
            return status.set_error(ErrorKind::Process, fmt::format("commit-tree failed for '{}'", commit.hash));
        }
        new_hash = fmt::format("n{}", commits.size() + 1);
        CommitNode node = commit;
        node.hash = new_hash;
        node.parents = {parent};
        node.set_message(message);
        commits[new_hash] = node;
        return true;
    }

    bool
    update_ref(const std::string& ref,
               const std::string& new_hash,
               const std::string& old_hash,
               Status& status) override {
        if (refs[ref] != old_hash) {
            return status.set_error(ErrorKind::Process, fmt::format("'{}' moved since it was read", ref));
        }
        refs[ref] = new_hash;
        ref_updates.emplace_back(ref, new_hash, old_hash);
        return true;
    }
};

}  // namespace phabstack
