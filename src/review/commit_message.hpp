#pragma once

/*
    Review metadata in commit messages.

    This is a lenient textual scan of what people write, not a protocol.
    Matching is case-insensitive.

        bug 1234, b=1234                    bug number, first one wins
        r=alice,bob                         granted reviewers
        r?carol                             requested reviewers
        Differential Revision: <url>/D12    revision link, on its own line
        Depends on D11                      dependency, may repeat

    Reviewer tokens count when preceded by the start of the text, whitespace
    or one of `(.[;,`. Names are made of word characters and `.-!`; a
    trailing `.` ends the sentence and is not part of the name.
*/

#include <optional>
#include <string>
#include <vector>

namespace phabstack {

struct CommitMessage {
    std::optional<std::string> bug;

    // In first-seen order, without duplicates.
    std::vector<std::string> reviewers_granted;
    std::vector<std::string> reviewers_requested;

    std::optional<std::string> revision_url;
    std::optional<std::string> revision_id;

    std::vector<std::string> depends_on;
};

CommitMessage
parse_commit_message(const std::string& message);

// `<base>/D<id>` with any trailing slash of the base dropped.
std::string
revision_link(const std::string& base_url, const std::string& revision_id);

// Message with its revision line set to `url`, replacing an existing one.
std::string
with_revision_link(const std::string& message, const std::string& url);

}  // namespace phabstack
