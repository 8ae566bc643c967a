#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace phabstack {

struct CommitNode {
    std::string hash;
    std::vector<std::string> parents;

    // Mercurial hash of the same changeset, when known.
    std::optional<std::string> secondary_hash;

    std::string tree;
    std::string author_name;
    std::string author_email;
    std::string author_date;

    // Message exactly as stored, and its first line.
    std::string message;
    std::string title;

    // The single parent of a commit in linear history. Root and merge
    // commits have none.
    std::optional<std::string>
    parent() const {
        if (parents.size() != 1) {
            return std::nullopt;
        }
        return parents.front();
    }

    bool
    has_real_secondary_hash() const {
        return secondary_hash.has_value() && *secondary_hash != hash;
    }

    void
    set_message(std::string raw) {
        message = std::move(raw);
        title = message.substr(0, message.find('\n'));
    }

    std::string
    short_hash() const {
        return hash.substr(0, 12);
    }
};

}  // namespace phabstack
